#include "api/http_server.hpp"
#include "cli/cli.hpp"
#include "collab/http_collaborators.hpp"
#include "discovery/topic_engine.hpp"
#include "pipeline/analysis_orchestrator.hpp"
#include "pipeline/pipeline_config.hpp"
#include "store/sqlite_analysis_store.hpp"
#include "util/errors.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>

using namespace nx;
using json = nlohmann::json;

// ============== Helper Functions ==============

// Config from --config (or the fallback chain), then command-line overrides
PipelineConfig load_cli_config(const Args& args) {
    PipelineConfig config = load_config_with_fallback(args.get("config").str());
    if (args.has("db")) config.database_path = args.get("db").str();
    if (args.has("port")) config.listen_port = args.get("port").as_int();
    if (args.has("verbose")) config.verbose = true;

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Configuration error: " + error);
    }
    return config;
}

std::unique_ptr<AnalysisOrchestrator> build_orchestrator(const PipelineConfig& config) {
    auto store = std::make_shared<SqliteAnalysisStore>(config.database_path);
    auto collaborators = HttpCollaborators::create(config.collaborator_config());
    return std::make_unique<AnalysisOrchestrator>(
        config, store, collaborators.classifier, collaborators.fetcher, collaborators.embedder);
}

void write_output(const json& j, const std::string& path) {
    if (path.empty()) {
        std::cout << j.dump(2) << "\n";
        return;
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    file << j.dump(2);
    std::cout << "Wrote " << path << "\n";
}

// ============== nx serve ==============
int cmd_serve(const Args& args) {
    PipelineConfig config = load_cli_config(args);
    auto orchestrator = build_orchestrator(config);

    std::cout << "Database:   " << config.database_path << "\n";
    std::cout << "GenAI:      " << config.genai_base_url << "\n";
    std::cout << "Fetcher:    " << config.fetcher_base_url << "\n";

    ApiRouter router(*orchestrator, config.verbose);
    HttpServer server(router, config.listen_address, static_cast<unsigned short>(config.listen_port), config.verbose);
    server.run();

    std::cout << "Waiting for " << orchestrator->in_flight() << " running analyses...\n";
    orchestrator->wait_for_idle();
    return 0;
}

// ============== nx analyze ==============
int cmd_analyze(const Args& args) {
    PipelineConfig config = load_cli_config(args);
    auto orchestrator = build_orchestrator(config);

    AnalysisRequest request;
    request.query = args.require("query");
    request.max_articles = args.get("max-articles").as_optional_int();
    request.nr_topics = args.get("nr-topics").as_optional_int();
    request.min_cluster_size = args.get("min-cluster-size").as_optional_int();
    request.source = args.get("source").str();
    request.category = args.get("category").str();
    if (args.has("no-auto-detect")) request.auto_detect = false;

    auto start = std::chrono::steady_clock::now();
    Analysis analysis = orchestrator->run_analysis(request);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    write_output(analysis_to_json(analysis), args.get("output").str());
    std::cerr << "Analysis " << analysis.id << " " << status_to_string(analysis.status)
              << " in " << elapsed << "ms\n";
    if (analysis.status == AnalysisStatus::FAILED) {
        std::cerr << "  Stage:  " << analysis.failure_stage << "\n";
        std::cerr << "  Reason: " << analysis.failure_reason << "\n";
        return 1;
    }
    return 0;
}

// ============== nx discover ==============
int cmd_discover(const Args& args) {
    PipelineConfig config = load_cli_config(args);
    std::string input_path = args.require("input");

    std::ifstream file(input_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + input_path);
    }
    json j;
    file >> j;
    if (j.is_array()) {
        j = json{{"articles", j}};
    }

    TopicDiscoveryInput input = TopicDiscoveryInput::from_json(j);
    if (args.has("query")) input.query = args.get("query").str();

    DiscoveryRequest request;
    request.query = input.query;
    request.documents = input.articles;
    request.target_topic_count = args.get("nr-topics").as_optional_int();
    request.min_cluster_size = args.get("min-cluster-size").as_optional_int();

    size_t without_embedding = 0;
    for (const auto& doc : request.documents) {
        if (doc.embedding.empty()) ++without_embedding;
    }
    std::cout << "Loaded " << request.documents.size() << " documents";
    if (without_embedding > 0) std::cout << " (" << without_embedding << " without embeddings, skipped)";
    std::cout << "\n";

    TopicDiscoveryEngine engine(config.discovery_config());
    DiscoveryResult result = engine.discover(request);

    std::cout << "Discovered " << result.topics.size() << " topics\n";
    for (const auto& topic : result.topics) {
        std::cout << "  [" << topic.relevance << "] " << topic.title
                  << " (" << topic.cluster_size << " articles)\n";
    }
    write_output(discovery_result_to_json(result, request.documents), args.get("output").str());
    return 0;
}

// ============== nx list ==============
int cmd_list(const Args& args) {
    PipelineConfig config = load_cli_config(args);
    SqliteAnalysisStore store(config.database_path);

    int limit = args.get("limit").as_int(20);
    int offset = args.get("offset").as_int(0);
    auto items = store.list_analyses(limit, offset);

    std::cout << store.count_analyses() << " analyses\n\n";
    for (const auto& a : items) {
        std::cout << a.id << "  " << format_timestamp(a.created_at_ms) << "  "
                  << status_to_string(a.status) << "  \"" << a.query << "\"\n";
    }
    return 0;
}

// ============== nx show ==============
int cmd_show(const Args& args) {
    PipelineConfig config = load_cli_config(args);
    SqliteAnalysisStore store(config.database_path);

    std::string id = args.require("id");
    auto analysis = store.get_analysis(id);
    if (!analysis) {
        throw NotFound("Analysis not found: " + id);
    }

    json j = analysis_to_json(*analysis);
    if (analysis->status == AnalysisStatus::FAILED) {
        j["failure_stage"] = analysis->failure_stage;
        j["failure_reason"] = analysis->failure_reason;
    }
    std::cout << j.dump(2) << "\n";
    return 0;
}

// ============== nx delete ==============
int cmd_delete(const Args& args) {
    PipelineConfig config = load_cli_config(args);
    SqliteAnalysisStore store(config.database_path);

    std::string id = args.require("id");
    if (!store.delete_analysis(id)) {
        throw NotFound("Analysis not found: " + id);
    }
    std::cout << "Deleted " << id << " (" << store.count_articles() << " articles remain)\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("nx", "1.0.0");

    // nx serve
    cli.register_command({
        "serve",
        "Run the analysis HTTP API",
        {
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"port", "p", "Listen port (overrides config)", "", false, false},
            {"db", "d", "SQLite database path (overrides config)", "", false, false},
            {"verbose", "V", "Verbose logging", "", false, true}
        },
        cmd_serve
    });

    // nx analyze
    cli.register_command({
        "analyze",
        "Run one analysis synchronously and print the result",
        {
            {"query", "q", "Research question", "", true, false},
            {"max-articles", "m", "Maximum documents to fetch", "", false, false},
            {"nr-topics", "n", "Target topic count (automatic when omitted)", "", false, false},
            {"min-cluster-size", "k", "Minimum articles per topic", "", false, false},
            {"source", "s", "Manual source: arxiv or reddit", "", false, false},
            {"category", "g", "Manual category or subreddit", "", false, false},
            {"no-auto-detect", "", "Skip classification; requires --source", "", false, true},
            {"output", "o", "Write result JSON here instead of stdout", "", false, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"db", "d", "SQLite database path (overrides config)", "", false, false},
            {"verbose", "V", "Verbose logging", "", false, true}
        },
        cmd_analyze
    });

    // nx discover
    cli.register_command({
        "discover",
        "Cluster embedded documents from a JSON file offline",
        {
            {"input", "i", "JSON file: article array or {query, articles}", "", true, false},
            {"output", "o", "Write topics JSON here instead of stdout", "", false, false},
            {"query", "q", "Query used for labeling", "", false, false},
            {"nr-topics", "n", "Target topic count", "", false, false},
            {"min-cluster-size", "k", "Minimum articles per topic", "", false, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"verbose", "V", "Verbose logging", "", false, true}
        },
        cmd_discover
    });

    // nx list
    cli.register_command({
        "list",
        "List stored analyses, newest first",
        {
            {"limit", "l", "Page size", "20", false, false},
            {"offset", "f", "Page offset", "0", false, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"db", "d", "SQLite database path (overrides config)", "", false, false}
        },
        cmd_list
    });

    // nx show
    cli.register_command({
        "show",
        "Print one analysis, including failure details",
        {
            {"id", "i", "Analysis id", "", true, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"db", "d", "SQLite database path (overrides config)", "", false, false}
        },
        cmd_show
    });

    // nx delete
    cli.register_command({
        "delete",
        "Delete an analysis and its topics",
        {
            {"id", "i", "Analysis id", "", true, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"db", "d", "SQLite database path (overrides config)", "", false, false}
        },
        cmd_delete
    });

    return cli.run(argc, argv);
}
