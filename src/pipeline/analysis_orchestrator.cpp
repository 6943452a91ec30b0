#include "pipeline/analysis_orchestrator.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <iterator>
#include <set>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

namespace nx {

namespace {

constexpr int kMaxPageSize = 100;
constexpr size_t kSnippetLength = 500;

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_advanced_query(const std::string& category) {
    return category.find(':') != std::string::npos ||
           category.find('+') != std::string::npos ||
           category.find(" AND ") != std::string::npos ||
           category.find(" OR ") != std::string::npos;
}

std::string bare_subreddit(const std::string& category) {
    std::string name = trim(category);
    if (name.rfind("/r/", 0) == 0) {
        name = name.substr(3);
    } else if (name.rfind("r/", 0) == 0) {
        name = name.substr(2);
    }
    while (!name.empty() && name.back() == '/') name.pop_back();
    return trim(name);
}

std::optional<int> optional_int(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_number_integer()) {
        throw InvalidRequest(std::string("'") + key + "' must be an integer");
    }
    return j[key].get<int>();
}

std::string optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return "";
    if (!j[key].is_string()) {
        throw InvalidRequest(std::string("'") + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

std::string embedding_text(const DiscoveryDocument& doc) {
    if (doc.summary.empty()) return doc.title;
    return doc.title + ". " + doc.summary;
}

std::string make_snippet(const std::string& summary) {
    if (summary.size() <= kSnippetLength) return summary;
    size_t cut = summary.rfind(' ', kSnippetLength);
    if (cut == std::string::npos || cut < kSnippetLength / 2) cut = kSnippetLength;
    return summary.substr(0, cut) + "...";
}

PipelineStage stage_for(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::PENDING:
        case AnalysisStatus::CLASSIFYING: return PipelineStage::Classification;
        case AnalysisStatus::FETCHING_ARTICLES: return PipelineStage::Fetch;
        case AnalysisStatus::EMBEDDING_ARTICLES: return PipelineStage::Embedding;
        case AnalysisStatus::DISCOVERING_TOPICS: return PipelineStage::Discovery;
        default: return PipelineStage::Persistence;
    }
}

void check_deadline(const CallContext& ctx, const std::string& after_stage) {
    if (ctx.expired()) {
        throw PipelineTimeout("Pipeline deadline exceeded after " + after_stage);
    }
}

std::vector<DiscoveryDocument> to_documents(const FetchResult& fetched, int max_articles, const std::string& tag) {
    std::vector<DiscoveryDocument> documents;
    std::set<std::string> seen;
    for (const auto& article : fetched.articles) {
        std::string external_id = article.id.empty() ? article.link : article.id;
        if (external_id.empty()) {
            log::warn("fetch", tag + "Skipping document without id or link: " + article.title);
            continue;
        }
        if (!seen.insert(external_id).second) continue;

        DiscoveryDocument doc;
        doc.id = external_id;
        doc.title = article.title;
        doc.summary = article.summary;
        doc.link = article.link;
        doc.metadata = article.metadata;
        documents.push_back(std::move(doc));

        if (static_cast<int>(documents.size()) >= max_articles) break;
    }
    return documents;
}

std::vector<Topic> to_topics(
    const std::string& analysis_id,
    const DiscoveryResult& result,
    const std::vector<DiscoveryDocument>& documents
) {
    std::vector<Topic> topics;
    topics.reserve(result.topics.size());
    for (const auto& discovered : result.topics) {
        Topic topic;
        topic.id = discovered.id;
        topic.analysis_id = analysis_id;
        topic.title = discovered.title;
        topic.description = discovered.description;
        topic.relevance = discovered.relevance;
        topic.embedding = discovered.centroid;
        for (size_t index : discovered.members) {
            const auto& doc = documents[index];
            Article article;
            article.external_id = doc.id;
            article.title = doc.title;
            article.link = doc.link;
            article.snippet = make_snippet(doc.summary);
            article.embedding = doc.embedding;
            topic.articles.push_back(std::move(article));
        }
        topic.article_count = static_cast<int>(topic.articles.size());
        topics.push_back(std::move(topic));
    }
    return topics;
}

} // namespace

// ============================================================================
// Requests
// ============================================================================

AnalysisRequest AnalysisRequest::from_json(const json& j) {
    if (!j.is_object()) {
        throw InvalidRequest("Request body must be a JSON object");
    }
    AnalysisRequest request;
    request.query = optional_string(j, "query");
    if (j.contains("auto_detect") && !j["auto_detect"].is_null()) {
        if (!j["auto_detect"].is_boolean()) {
            throw InvalidRequest("'auto_detect' must be a boolean");
        }
        request.auto_detect = j["auto_detect"];
    }
    request.max_articles = optional_int(j, "max_articles");
    request.nr_topics = optional_int(j, "nr_topics");
    request.min_cluster_size = optional_int(j, "min_cluster_size");
    request.source = optional_string(j, "source");
    request.category = optional_string(j, "category");
    return request;
}

bool AnalysisRequest::has_manual_source() const {
    return !trim(source).empty() && (!trim(category).empty() || !auto_detect);
}

void validate_request(const AnalysisRequest& request) {
    if (trim(request.query).empty()) {
        throw InvalidRequest("query must not be empty");
    }
    if (request.max_articles && *request.max_articles < 1) {
        throw InvalidRequest("max_articles must be at least 1");
    }
    if (request.min_cluster_size && *request.min_cluster_size < 1) {
        throw InvalidRequest("min_cluster_size must be at least 1");
    }
    if (request.nr_topics && *request.nr_topics < 1) {
        throw InvalidRequest("nr_topics must be at least 1");
    }

    const std::string source = to_lower(trim(request.source));
    const std::string category = trim(request.category);
    if (!source.empty() && source != "arxiv" && source != "reddit") {
        throw InvalidRequest("source must be 'arxiv' or 'reddit'");
    }
    if (source.empty() && !category.empty()) {
        throw InvalidRequest("category requires a source");
    }
    if (!request.auto_detect && source.empty()) {
        throw InvalidRequest("source is required when auto_detect is false");
    }
    if (request.auto_detect && !source.empty() && category.empty()) {
        throw InvalidRequest("source requires a category unless auto_detect is false");
    }
}

TopicDiscoveryInput TopicDiscoveryInput::from_json(const json& j) {
    if (!j.is_object()) {
        throw InvalidRequest("Request body must be a JSON object");
    }
    TopicDiscoveryInput input;
    input.query = optional_string(j, "query");
    input.min_cluster_size = optional_int(j, "min_cluster_size");
    input.nr_topics = optional_int(j, "nr_topics");

    const char* ids_key = j.contains("article_ids") ? "article_ids" : "article_keys";
    if (j.contains(ids_key) && !j[ids_key].is_null()) {
        if (!j[ids_key].is_array()) {
            throw InvalidRequest(std::string("'") + ids_key + "' must be an array");
        }
        for (const auto& id : j[ids_key]) {
            if (!id.is_string()) {
                throw InvalidRequest(std::string("'") + ids_key + "' must contain strings");
            }
            input.article_ids.push_back(id.get<std::string>());
        }
    }

    if (j.contains("articles") && !j["articles"].is_null()) {
        if (!j["articles"].is_array()) {
            throw InvalidRequest("'articles' must be an array");
        }
        for (const auto& a : j["articles"]) {
            if (!a.is_object()) {
                throw InvalidRequest("'articles' must contain objects");
            }
            DiscoveryDocument doc;
            doc.id = optional_string(a, "id");
            doc.title = optional_string(a, "title");
            doc.link = optional_string(a, "link");
            doc.summary = optional_string(a, "summary");
            if (doc.summary.empty()) doc.summary = optional_string(a, "snippet");
            if (a.contains("embedding") && a["embedding"].is_array()) {
                for (const auto& v : a["embedding"]) {
                    if (!v.is_number()) {
                        throw InvalidRequest("Embedding values must be numbers");
                    }
                    doc.embedding.push_back(v.get<float>());
                }
            }
            if (a.contains("metadata") && a["metadata"].is_object()) {
                doc.metadata = a["metadata"];
            }
            input.articles.push_back(std::move(doc));
        }
    }
    return input;
}

json discovery_result_to_json(const DiscoveryResult& result, const std::vector<DiscoveryDocument>& documents) {
    json topics = json::array();
    for (const auto& topic : result.topics) {
        json articles = json::array();
        for (size_t index : topic.members) {
            const auto& doc = documents[index];
            articles.push_back({
                {"id", doc.id},
                {"title", doc.title},
                {"link", doc.link},
                {"snippet", make_snippet(doc.summary)}
            });
        }
        topics.push_back({
            {"id", topic.id},
            {"title", topic.title},
            {"description", topic.description},
            {"keywords", topic.keywords},
            {"article_count", topic.cluster_size},
            {"relevance", topic.relevance},
            {"articles", articles}
        });
    }
    return {
        {"query", result.query},
        {"topics", topics},
        {"total_articles_processed", result.total_articles_processed}
    };
}

// ============================================================================
// State Machine
// ============================================================================

AnalysisStatus next_status(AnalysisStatus current, StageOutcome outcome) {
    if (is_terminal(current)) {
        throw std::logic_error("No transition out of terminal status " + status_to_string(current));
    }

    switch (outcome) {
        case StageOutcome::Failed:
            return AnalysisStatus::FAILED;
        case StageOutcome::SucceededEmpty:
            if (current != AnalysisStatus::FETCHING_ARTICLES) {
                throw std::logic_error("Empty result is only valid while fetching, not in " +
                                       status_to_string(current));
            }
            return AnalysisStatus::COMPLETED;
        case StageOutcome::Succeeded:
            switch (current) {
                case AnalysisStatus::PENDING: return AnalysisStatus::CLASSIFYING;
                case AnalysisStatus::CLASSIFYING: return AnalysisStatus::FETCHING_ARTICLES;
                case AnalysisStatus::FETCHING_ARTICLES: return AnalysisStatus::EMBEDDING_ARTICLES;
                case AnalysisStatus::EMBEDDING_ARTICLES: return AnalysisStatus::DISCOVERING_TOPICS;
                case AnalysisStatus::DISCOVERING_TOPICS: return AnalysisStatus::COMPLETED;
                default: break;
            }
            break;
    }
    throw std::logic_error("Unhandled transition from " + status_to_string(current));
}

// ============================================================================
// Feed Descriptor
// ============================================================================

FeedDescriptor derive_feed_descriptor(
    const ClassificationResult& classification,
    const std::string& default_research_category,
    const std::string& default_community_category
) {
    const std::string source = to_lower(trim(classification.source));
    const std::string source_type = to_lower(trim(classification.source_type));

    FeedDescriptor feed;
    if (source_type == "community") {
        feed.type = AnalysisType::COMMUNITY;
    } else if (source_type == "research") {
        feed.type = AnalysisType::RESEARCH;
    } else {
        feed.type = source == "reddit" ? AnalysisType::COMMUNITY : AnalysisType::RESEARCH;
    }

    feed.source = source.empty()
        ? (feed.type == AnalysisType::COMMUNITY ? "reddit" : "arxiv")
        : source;

    std::string category = trim(classification.suggested_category);
    if (feed.type == AnalysisType::RESEARCH) {
        if (category.empty()) category = trim(default_research_category);
        feed.feed_url = is_advanced_query(category) ? category : "cat:" + category;
    } else {
        std::string subreddit = bare_subreddit(category);
        if (subreddit.empty()) subreddit = bare_subreddit(default_community_category);
        feed.feed_url = subreddit;
    }
    return feed;
}

// ============================================================================
// Orchestrator
// ============================================================================

AnalysisOrchestrator::AnalysisOrchestrator(
    const PipelineConfig& config,
    std::shared_ptr<AnalysisStore> store,
    std::shared_ptr<ClassificationClient> classifier,
    std::shared_ptr<ArticleFetchClient> fetcher,
    std::shared_ptr<EmbeddingClient> embedder
)
    : config_(config)
    , store_(std::move(store))
    , classifier_(std::move(classifier))
    , fetcher_(std::move(fetcher))
    , embedder_(std::move(embedder))
    , engine_(config.discovery_config()) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    if (!store_ || !classifier_ || !fetcher_ || !embedder_) {
        throw std::invalid_argument("Orchestrator requires a store and all three collaborators");
    }
    discovery_pool_ = std::make_unique<WorkerPool>(static_cast<size_t>(config_.discovery_threads));
}

AnalysisOrchestrator::~AnalysisOrchestrator() {
    wait_for_idle();
}

std::string AnalysisOrchestrator::submit_analysis(const AnalysisRequest& request) {
    validate_request(request);
    std::string id = create_stub(request);
    launch(id, request);
    return id;
}

Analysis AnalysisOrchestrator::run_analysis(const AnalysisRequest& request) {
    validate_request(request);
    std::string id = create_stub(request);
    if (!register_run(id)) {
        throw std::logic_error("Pipeline already running for analysis " + id);
    }
    run_pipeline(id, request);
    finish_run(id);
    return get_analysis(id);
}

std::string AnalysisOrchestrator::create_stub(const AnalysisRequest& request) {
    Analysis stub;
    stub.id = generate_uuid();
    stub.query = trim(request.query);
    stub.status = AnalysisStatus::PENDING;
    stub.created_at_ms = now_millis();
    store_->create_analysis(stub);
    log::info(config_.verbose, "pipeline", "[" + stub.id + "] Created analysis for \"" + stub.query + "\"");
    return stub.id;
}

bool AnalysisOrchestrator::register_run(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.insert(id).second;
}

void AnalysisOrchestrator::finish_run(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.erase(id);
    }
    idle_cv_.notify_all();
}

void AnalysisOrchestrator::reap_finished_workers() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto split = std::partition(workers_.begin(), workers_.end(),
                                    [](const Worker& w) { return !w.done->load(); });
        std::move(split, workers_.end(), std::back_inserter(finished));
        workers_.erase(split, workers_.end());
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void AnalysisOrchestrator::launch(const std::string& id, const AnalysisRequest& request) {
    if (!register_run(id)) {
        throw std::logic_error("Pipeline already running for analysis " + id);
    }
    reap_finished_workers();

    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        std::thread thread([this, id, request, done]() {
            run_pipeline(id, request);
            finish_run(id);
            done->store(true);
        });
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.push_back(Worker{std::move(thread), done});
    } catch (const std::system_error& e) {
        finish_run(id);
        fail(id, PipelineStage::Validation, std::string("Could not start pipeline thread: ") + e.what());
        throw;
    }
}

void AnalysisOrchestrator::wait_for_idle() {
    std::vector<Worker> workers;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return running_.empty(); });
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

size_t AnalysisOrchestrator::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.size();
}

// ============================================================================
// Reads and Deletion
// ============================================================================

Analysis AnalysisOrchestrator::get_analysis(const std::string& id) {
    auto analysis = store_->get_analysis(id);
    if (!analysis) {
        throw NotFound("Analysis not found: " + id);
    }
    return *analysis;
}

AnalysisPage AnalysisOrchestrator::list_analyses(int limit, int offset) {
    if (limit < 1) throw InvalidRequest("limit must be at least 1");
    if (offset < 0) throw InvalidRequest("offset must not be negative");

    AnalysisPage page;
    page.limit = std::min(limit, kMaxPageSize);
    page.offset = offset;
    page.items = store_->list_analyses(page.limit, page.offset);
    page.total = store_->count_analyses();
    return page;
}

void AnalysisOrchestrator::delete_analysis(const std::string& id) {
    if (!store_->delete_analysis(id)) {
        throw NotFound("Analysis not found: " + id);
    }
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running = running_.count(id) > 0;
    }
    if (running) {
        log::info(config_.verbose, "pipeline", "[" + id + "] Deleted while running; results will be discarded");
    }
}

std::vector<SimilarTopic> AnalysisOrchestrator::similar_topics(const std::string& topic_id, int limit) {
    if (limit < 1) throw InvalidRequest("limit must be at least 1");
    return store_->find_similar_topics(topic_id, std::min(limit, kMaxPageSize));
}

json AnalysisOrchestrator::list_categories(const std::string& source) {
    const std::string normalized = to_lower(trim(source));
    if (normalized.empty()) {
        throw InvalidRequest("source must not be empty");
    }
    auto ctx = CallContext::with_budget("", std::chrono::seconds(config_.request_timeout_seconds));
    return fetcher_->list_categories(normalized, ctx);
}

// ============================================================================
// Discovery Endpoint
// ============================================================================

DiscoveryResult AnalysisOrchestrator::discover_topics(TopicDiscoveryInput& input) {
    if (input.articles.empty()) {
        throw InvalidRequest("articles must not be empty");
    }
    if (input.min_cluster_size && *input.min_cluster_size < 1) {
        throw InvalidRequest("min_cluster_size must be at least 1");
    }
    if (input.nr_topics && *input.nr_topics < 1) {
        throw InvalidRequest("nr_topics must be at least 1");
    }
    for (size_t i = 0; i < input.articles.size(); ++i) {
        auto& doc = input.articles[i];
        if (doc.id.empty() && i < input.article_ids.size()) {
            doc.id = input.article_ids[i];
        }
        if (doc.id.empty()) {
            throw InvalidRequest("article " + std::to_string(i) + " has no id");
        }
    }

    auto ctx = CallContext::with_budget("discover", std::chrono::seconds(config_.pipeline_timeout_seconds));

    std::vector<size_t> missing;
    for (size_t i = 0; i < input.articles.size(); ++i) {
        if (input.articles[i].embedding.empty()) missing.push_back(i);
    }

    if (!missing.empty()) {
        std::vector<std::string> ids;
        for (size_t i : missing) ids.push_back(input.articles[i].id);

        std::map<std::string, std::vector<float>> cached;
        try {
            cached = embedder_->lookup(ids, ctx);
        } catch (const CollaboratorError& e) {
            log::warn("discover", std::string("Embedding cache lookup failed, generating all: ") + e.what());
        }

        std::vector<size_t> still_missing;
        for (size_t i : missing) {
            auto it = cached.find(input.articles[i].id);
            if (it != cached.end() && !it->second.empty()) {
                input.articles[i].embedding = it->second;
            } else {
                still_missing.push_back(i);
            }
        }
        log::info(config_.verbose, "discover",
                  std::to_string(missing.size() - still_missing.size()) + " cached, " +
                  std::to_string(still_missing.size()) + " to generate");

        const size_t batch = static_cast<size_t>(std::max(1, config_.embedding_batch_size));
        for (size_t start = 0; start < still_missing.size(); start += batch) {
            size_t end = std::min(still_missing.size(), start + batch);
            std::vector<std::string> texts, batch_ids;
            for (size_t k = start; k < end; ++k) {
                const auto& doc = input.articles[still_missing[k]];
                texts.push_back(embedding_text(doc));
                batch_ids.push_back(doc.id);
            }
            EmbeddingResult generated = embedder_->embed(texts, batch_ids, ctx);
            if (generated.embeddings.size() != texts.size()) {
                throw CollaboratorError("Embedding collaborator returned " +
                                        std::to_string(generated.embeddings.size()) + " vectors for " +
                                        std::to_string(texts.size()) + " texts", 200, false);
            }
            for (size_t k = start; k < end; ++k) {
                input.articles[still_missing[k]].embedding = std::move(generated.embeddings[k - start]);
            }
        }
    }

    DiscoveryRequest request;
    request.query = input.query;
    request.documents = input.articles;
    request.target_topic_count = input.nr_topics;
    request.min_cluster_size = input.min_cluster_size.value_or(config_.default_min_cluster_size);
    return run_discovery(request, ctx);
}

// ============================================================================
// Pipeline
// ============================================================================

void AnalysisOrchestrator::run_pipeline(const std::string& id, const AnalysisRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    const std::string tag = "[" + id + "] ";
    CallContext ctx = CallContext::with_budget(id, std::chrono::seconds(config_.pipeline_timeout_seconds));
    AnalysisStatus status = AnalysisStatus::PENDING;

    try {
        // Classification
        if (!advance(id, status, StageOutcome::Succeeded)) return;
        ClassificationResult classification = classify(request, ctx);
        FeedDescriptor feed = derive_feed_descriptor(
            classification, config_.default_research_category, config_.default_community_category);
        if (!store_->update_classification(id, feed.type, feed.feed_url)) {
            log::warn("pipeline", tag + "Analysis deleted during classification; stopping");
            return;
        }
        log::info(config_.verbose, "classification",
                  tag + feed.source + " / " + analysis_type_to_string(feed.type) + " -> " + feed.feed_url);
        check_deadline(ctx, "classification");

        // Fetch
        if (!advance(id, status, StageOutcome::Succeeded)) return;
        FetchResult fetched = fetch(feed, request, ctx);
        const int max_articles = request.max_articles.value_or(config_.default_max_articles);
        std::vector<DiscoveryDocument> documents = to_documents(fetched, max_articles, tag);
        log::info(config_.verbose, "fetch", tag + std::to_string(documents.size()) + " documents");
        check_deadline(ctx, "fetch");

        if (documents.empty()) {
            AnalysisStatus next = next_status(status, StageOutcome::SucceededEmpty);
            if (!store_->commit_results(id, {}, 0)) {
                log::warn("pipeline", tag + "Analysis deleted before completion; nothing stored");
                return;
            }
            status = next;
            log::info(config_.verbose, "pipeline", tag + "No documents fetched; completed with zero topics");
            return;
        }

        // Embedding
        if (!advance(id, status, StageOutcome::Succeeded)) return;
        embed_documents(documents, ctx);
        check_deadline(ctx, "embedding");

        // Discovery
        if (!advance(id, status, StageOutcome::Succeeded)) return;
        DiscoveryRequest discovery;
        discovery.query = trim(request.query);
        discovery.documents = documents;
        discovery.target_topic_count = request.nr_topics ? request.nr_topics : config_.default_nr_topics;
        discovery.min_cluster_size = request.min_cluster_size.value_or(config_.default_min_cluster_size);
        DiscoveryResult result = run_discovery(discovery, ctx);
        check_deadline(ctx, "discovery");

        // Persistence
        AnalysisStatus next = next_status(status, StageOutcome::Succeeded);
        std::vector<Topic> topics = to_topics(id, result, documents);
        if (!store_->commit_results(id, topics, result.total_articles_processed)) {
            log::warn("pipeline", tag + "Analysis deleted before completion; results discarded");
            return;
        }
        status = next;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        log::info(config_.verbose, "pipeline",
                  tag + "Completed with " + std::to_string(topics.size()) + " topics from " +
                  std::to_string(result.total_articles_processed) + " articles in " +
                  std::to_string(elapsed) + "ms");
    } catch (const PipelineError& e) {
        fail(id, e.stage(), e.what());
    } catch (const std::exception& e) {
        fail(id, stage_for(status), e.what());
    }
}

bool AnalysisOrchestrator::advance(const std::string& id, AnalysisStatus& status, StageOutcome outcome) {
    AnalysisStatus next = next_status(status, outcome);
    if (!store_->update_status(id, next)) {
        log::warn("pipeline", "[" + id + "] Analysis deleted or already finished; stopping before " +
                  status_to_string(next));
        return false;
    }
    status = next;
    log::info(config_.verbose, "pipeline", "[" + id + "] " + status_to_string(next));
    return true;
}

ClassificationResult AnalysisOrchestrator::classify(const AnalysisRequest& request, const CallContext& ctx) {
    if (request.has_manual_source()) {
        ClassificationResult manual;
        manual.source = to_lower(trim(request.source));
        manual.suggested_category = trim(request.category);
        log::info(config_.verbose, "classification", "[" + ctx.analysis_id + "] Manual source override");
        return manual;
    }
    try {
        return classifier_->classify(trim(request.query), ctx);
    } catch (const CollaboratorError& e) {
        if (ctx.expired()) throw PipelineTimeout(std::string("Classification timed out: ") + e.what());
        throw ClassificationFailure(e.what());
    }
}

FetchResult AnalysisOrchestrator::fetch(const FeedDescriptor& feed, const AnalysisRequest& request, const CallContext& ctx) {
    FetchRequest fetch_request;
    fetch_request.source = feed.source;
    fetch_request.category = feed.feed_url;
    fetch_request.query = trim(request.query);
    fetch_request.limit = request.max_articles.value_or(config_.default_max_articles);
    try {
        return fetcher_->fetch_articles(fetch_request, ctx);
    } catch (const CollaboratorError& e) {
        if (ctx.expired()) throw PipelineTimeout(std::string("Article fetch timed out: ") + e.what());
        throw FetchFailure(e.what());
    }
}

void AnalysisOrchestrator::embed_documents(std::vector<DiscoveryDocument>& documents, const CallContext& ctx) {
    const size_t batch = static_cast<size_t>(std::max(1, config_.embedding_batch_size));
    int cached = 0;

    for (size_t start = 0; start < documents.size(); start += batch) {
        size_t end = std::min(documents.size(), start + batch);
        std::vector<std::string> texts, ids;
        for (size_t i = start; i < end; ++i) {
            texts.push_back(embedding_text(documents[i]));
            ids.push_back(documents[i].id);
        }

        EmbeddingResult result;
        try {
            result = embedder_->embed(texts, ids, ctx);
        } catch (const CollaboratorError& e) {
            if (ctx.expired()) throw PipelineTimeout(std::string("Embedding timed out: ") + e.what());
            throw EmbeddingFailure(e.what());
        }
        if (result.embeddings.size() != texts.size()) {
            throw EmbeddingFailure("Embedding collaborator returned " + std::to_string(result.embeddings.size()) +
                                   " vectors for " + std::to_string(texts.size()) + " texts");
        }
        for (size_t i = start; i < end; ++i) {
            documents[i].embedding = std::move(result.embeddings[i - start]);
        }
        cached += result.cached_count;

        log::progress(config_.verbose, "embedding", static_cast<int>(end), static_cast<int>(documents.size()),
                      ctx.analysis_id);
        check_deadline(ctx, "embedding batch");
    }
    if (cached > 0) {
        log::info(config_.verbose, "embedding", "[" + ctx.analysis_id + "] " + std::to_string(cached) + " served from cache");
    }
}

DiscoveryResult AnalysisOrchestrator::run_discovery(const DiscoveryRequest& request, const CallContext& ctx) {
    std::future<DiscoveryResult> future;
    try {
        future = discovery_pool_->submit([this, request]() { return engine_.discover(request); });
    } catch (const std::runtime_error& e) {
        throw DiscoveryFailure(std::string("Could not schedule topic discovery: ") + e.what());
    }

    if (ctx.deadline) {
        if (future.wait_until(*ctx.deadline) != std::future_status::ready) {
            throw PipelineTimeout("Topic discovery did not finish before the pipeline deadline");
        }
    }

    try {
        return future.get();
    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        throw DiscoveryFailure(std::string("Topic discovery failed: ") + e.what());
    }
}

void AnalysisOrchestrator::fail(const std::string& id, PipelineStage stage, const std::string& reason) {
    const std::string stage_name = pipeline_stage_to_string(stage);
    log::error(stage_name, "[" + id + "] " + reason);
    try {
        if (!store_->mark_failed(id, stage_name, reason)) {
            log::warn("pipeline", "[" + id + "] Failure not recorded; analysis deleted or already finished");
        }
    } catch (const std::exception& e) {
        log::error("persistence", "[" + id + "] Could not record failure: " + e.what());
    }
}

} // namespace nx
