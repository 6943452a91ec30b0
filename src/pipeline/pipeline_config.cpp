#include "pipeline/pipeline_config.hpp"
#include "util/log.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace nx {

namespace {

int env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        log::warn("config", std::string("Ignoring non-numeric ") + name + "=" + value);
        return fallback;
    }
}

bool env_flag(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    std::string v(value);
    return v == "1" || v == "true" || v == "TRUE" || v == "yes";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

} // namespace

// ============================================================================
// PipelineConfig
// ============================================================================

PipelineConfig PipelineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    PipelineConfig config;

    // Collaborators
    if (j.contains("genai_base_url")) config.genai_base_url = j["genai_base_url"];
    if (j.contains("fetcher_base_url")) config.fetcher_base_url = j["fetcher_base_url"];
    if (j.contains("request_timeout_seconds")) config.request_timeout_seconds = j["request_timeout_seconds"];
    if (j.contains("max_retries")) config.max_retries = j["max_retries"];
    if (j.contains("retry_backoff_ms")) config.retry_backoff_ms = j["retry_backoff_ms"];

    // Storage and server
    if (j.contains("database_path")) config.database_path = j["database_path"];
    if (j.contains("listen_address")) config.listen_address = j["listen_address"];
    if (j.contains("listen_port")) config.listen_port = j["listen_port"];

    // Pipeline
    if (j.contains("pipeline_timeout_seconds")) config.pipeline_timeout_seconds = j["pipeline_timeout_seconds"];
    if (j.contains("embedding_batch_size")) config.embedding_batch_size = j["embedding_batch_size"];
    if (j.contains("discovery_threads")) config.discovery_threads = j["discovery_threads"];

    // Analysis defaults
    if (j.contains("default_max_articles")) config.default_max_articles = j["default_max_articles"];
    if (j.contains("default_min_cluster_size")) config.default_min_cluster_size = j["default_min_cluster_size"];
    if (j.contains("default_nr_topics") && !j["default_nr_topics"].is_null()) {
        config.default_nr_topics = j["default_nr_topics"].get<int>();
    }
    if (j.contains("max_articles_per_topic")) config.max_articles_per_topic = j["max_articles_per_topic"];
    if (j.contains("random_seed")) config.random_seed = j["random_seed"];
    if (j.contains("default_research_category")) config.default_research_category = j["default_research_category"];
    if (j.contains("default_community_category")) config.default_community_category = j["default_community_category"];

    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

void PipelineConfig::to_json_file(const std::string& path) const {
    json j;

    j["genai_base_url"] = genai_base_url;
    j["fetcher_base_url"] = fetcher_base_url;
    j["request_timeout_seconds"] = request_timeout_seconds;
    j["max_retries"] = max_retries;
    j["retry_backoff_ms"] = retry_backoff_ms;

    j["database_path"] = database_path;
    j["listen_address"] = listen_address;
    j["listen_port"] = listen_port;

    j["pipeline_timeout_seconds"] = pipeline_timeout_seconds;
    j["embedding_batch_size"] = embedding_batch_size;
    j["discovery_threads"] = discovery_threads;

    j["default_max_articles"] = default_max_articles;
    j["default_min_cluster_size"] = default_min_cluster_size;
    j["default_nr_topics"] = default_nr_topics ? json(*default_nr_topics) : json(nullptr);
    j["max_articles_per_topic"] = max_articles_per_topic;
    j["random_seed"] = random_seed;
    j["default_research_category"] = default_research_category;
    j["default_community_category"] = default_community_category;

    j["verbose"] = verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << j.dump(2);
}

PipelineConfig PipelineConfig::from_environment() {
    PipelineConfig config;

    const char* genai = std::getenv("NX_GENAI_URL");
    if (genai) config.genai_base_url = genai;

    const char* fetcher = std::getenv("NX_FETCHER_URL");
    if (fetcher) config.fetcher_base_url = fetcher;

    const char* db = std::getenv("NX_DB_PATH");
    if (db) config.database_path = db;

    config.listen_port = env_int("NX_PORT", config.listen_port);
    config.pipeline_timeout_seconds = env_int("NX_PIPELINE_TIMEOUT", config.pipeline_timeout_seconds);
    config.verbose = env_flag("NX_VERBOSE", config.verbose);

    return config;
}

bool PipelineConfig::validate(std::string& error_message) const {
    if (genai_base_url.empty() || fetcher_base_url.empty()) {
        error_message = "Collaborator base URLs are required";
        return false;
    }
    if (database_path.empty()) {
        error_message = "Database path is required";
        return false;
    }
    if (listen_port <= 0 || listen_port > 65535) {
        error_message = "Listen port must be between 1 and 65535";
        return false;
    }
    if (request_timeout_seconds <= 0 || pipeline_timeout_seconds <= 0) {
        error_message = "Timeouts must be positive";
        return false;
    }
    if (max_retries < 1) {
        error_message = "max_retries must be at least 1";
        return false;
    }
    if (retry_backoff_ms < 0) {
        error_message = "retry_backoff_ms must not be negative";
        return false;
    }
    if (embedding_batch_size < 1 || discovery_threads < 1) {
        error_message = "embedding_batch_size and discovery_threads must be at least 1";
        return false;
    }
    if (default_max_articles < 1 || default_min_cluster_size < 1 || max_articles_per_topic < 1) {
        error_message = "Analysis defaults must be at least 1";
        return false;
    }
    if (default_nr_topics && *default_nr_topics < 1) {
        error_message = "default_nr_topics must be at least 1";
        return false;
    }
    return true;
}

CollaboratorConfig PipelineConfig::collaborator_config() const {
    CollaboratorConfig c;
    c.genai_base_url = genai_base_url;
    c.fetcher_base_url = fetcher_base_url;
    c.timeout_seconds = request_timeout_seconds;
    c.max_retries = max_retries;
    c.retry_backoff_ms = retry_backoff_ms;
    c.verbose = verbose;
    return c;
}

DiscoveryConfig PipelineConfig::discovery_config() const {
    DiscoveryConfig d;
    d.min_cluster_size = default_min_cluster_size;
    d.max_articles_per_topic = max_articles_per_topic;
    d.reduction.seed = random_seed;
    d.verbose = verbose;
    return d;
}

// ============================================================================
// Utility Functions
// ============================================================================

PipelineConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> candidates;
    if (!config_path.empty()) {
        candidates.push_back(config_path);
    }
    candidates.push_back(".nx_config.json");
    candidates.push_back("../.nx_config.json");
    candidates.push_back("../../.nx_config.json");

    for (const auto& path : candidates) {
        if (!file_exists(path)) continue;
        try {
            return PipelineConfig::from_json_file(path);
        } catch (const std::exception& e) {
            log::warn("config", "Skipping " + path + ": " + e.what());
        }
    }

    return PipelineConfig::from_environment();
}

} // namespace nx
