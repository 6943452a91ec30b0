#pragma once

#include "collab/collaborators.hpp"
#include "discovery/topic_engine.hpp"
#include "model/analysis.hpp"
#include "pipeline/pipeline_config.hpp"
#include "pipeline/worker_pool.hpp"
#include "store/analysis_store.hpp"
#include "util/errors.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace nx {

// ============================================================================
// Requests
// ============================================================================

/**
 * @brief Options of a submitted analysis
 */
struct AnalysisRequest {
    std::string query;
    bool auto_detect = true;                ///< false: use source/category as given
    std::optional<int> max_articles;
    std::optional<int> nr_topics;           ///< Target topic count; automatic when unset
    std::optional<int> min_cluster_size;
    std::string source;                     ///< Manual override: "arxiv" or "reddit"
    std::string category;                   ///< Manual override category or subreddit

    /**
     * @brief Parse the POST /api/v1/analyses body
     *
     * @throws InvalidRequest on mistyped fields
     */
    static AnalysisRequest from_json(const nlohmann::json& j);

    /// Source and category given explicitly, so classification is skipped.
    bool has_manual_source() const;
};

/**
 * @brief Reject a request before anything is persisted
 *
 * @throws InvalidRequest on an empty query, non-positive options or an
 *         inconsistent manual source
 */
void validate_request(const AnalysisRequest& request);

/**
 * @brief Body of POST /api/v1/topics/discover
 */
struct TopicDiscoveryInput {
    std::string query;
    std::vector<std::string> article_ids;   ///< Fills ids missing from `articles`, by position
    std::vector<DiscoveryDocument> articles;
    std::optional<int> min_cluster_size;
    std::optional<int> nr_topics;

    /// @throws InvalidRequest on mistyped fields
    static TopicDiscoveryInput from_json(const nlohmann::json& j);
};

/// {query, topics[{id, title, description, article_count, relevance, articles[]}], total_articles_processed}
nlohmann::json discovery_result_to_json(
    const DiscoveryResult& result,
    const std::vector<DiscoveryDocument>& documents
);

// ============================================================================
// State Machine
// ============================================================================

/**
 * @brief Result of the stage that owns the current status
 */
enum class StageOutcome {
    Succeeded,
    SucceededEmpty,                         ///< Fetch returned no documents
    Failed
};

/**
 * @brief Status after a stage finishes
 *
 * Succeeded moves one step along the forward path, SucceededEmpty is only
 * legal while fetching and jumps to COMPLETED, Failed yields FAILED.
 *
 * @throws std::logic_error for any transition out of a terminal status or an
 *         empty outcome outside FETCHING_ARTICLES
 */
AnalysisStatus next_status(AnalysisStatus current, StageOutcome outcome);

// ============================================================================
// Feed Descriptor
// ============================================================================

struct FeedDescriptor {
    AnalysisType type = AnalysisType::RESEARCH;
    std::string source;                     ///< "arxiv" or "reddit"
    std::string feed_url;                   ///< Sent to the fetch collaborator as the category
};

/**
 * @brief Resolve the fetch descriptor from a classification verdict
 *
 * Research categories become "cat:<category>" unless they already are an
 * advanced query. Community categories are reduced to the bare subreddit.
 * An empty category falls back to the default for the source type.
 */
FeedDescriptor derive_feed_descriptor(
    const ClassificationResult& classification,
    const std::string& default_research_category,
    const std::string& default_community_category
);

// ============================================================================
// Orchestrator
// ============================================================================

/**
 * @brief Page of analysis summaries, newest first
 */
struct AnalysisPage {
    std::vector<Analysis> items;
    int total = 0;
    int limit = 0;
    int offset = 0;
};

/**
 * @brief Runs analyses through classification, fetch, embedding and discovery
 *
 * Each submitted analysis runs on its own pipeline thread; clustering runs on
 * a shared worker pool. Status changes are written to the store before the
 * next stage starts. Every stage failure, including the pipeline deadline,
 * ends in FAILED with the stage and cause recorded for operators.
 */
class AnalysisOrchestrator {
public:
    AnalysisOrchestrator(
        const PipelineConfig& config,
        std::shared_ptr<AnalysisStore> store,
        std::shared_ptr<ClassificationClient> classifier,
        std::shared_ptr<ArticleFetchClient> fetcher,
        std::shared_ptr<EmbeddingClient> embedder
    );

    /// Waits for running pipelines.
    ~AnalysisOrchestrator();

    AnalysisOrchestrator(const AnalysisOrchestrator&) = delete;
    AnalysisOrchestrator& operator=(const AnalysisOrchestrator&) = delete;

    /**
     * @brief Validate, persist a PENDING stub and start the pipeline
     *
     * @return The new analysis id, readable immediately
     * @throws InvalidRequest before anything is persisted
     */
    std::string submit_analysis(const AnalysisRequest& request);

    /**
     * @brief Run one analysis to a terminal status on the calling thread
     */
    Analysis run_analysis(const AnalysisRequest& request);

    /// @throws NotFound
    Analysis get_analysis(const std::string& id);

    /// Limit is capped at 100. @throws InvalidRequest on limit < 1 or offset < 0
    AnalysisPage list_analyses(int limit, int offset);

    /// @throws NotFound
    void delete_analysis(const std::string& id);

    /// @throws NotFound when the topic does not exist
    std::vector<SimilarTopic> similar_topics(const std::string& topic_id, int limit);

    /**
     * @brief Cluster caller-supplied articles
     *
     * Articles without an inline embedding are looked up in the embedding
     * cache by id and only the missing ones are generated. Fills the
     * embeddings into `input.articles`.
     *
     * @throws InvalidRequest, CollaboratorError, DiscoveryFailure, PipelineTimeout
     */
    DiscoveryResult discover_topics(TopicDiscoveryInput& input);

    /// Category groups of a source, from the fetch collaborator.
    nlohmann::json list_categories(const std::string& source);

    /// Blocks until every launched pipeline has finished.
    void wait_for_idle();

    /// Number of pipelines currently running.
    size_t in_flight() const;

    const PipelineConfig& config() const { return config_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    PipelineConfig config_;
    std::shared_ptr<AnalysisStore> store_;
    std::shared_ptr<ClassificationClient> classifier_;
    std::shared_ptr<ArticleFetchClient> fetcher_;
    std::shared_ptr<EmbeddingClient> embedder_;
    TopicDiscoveryEngine engine_;
    std::unique_ptr<WorkerPool> discovery_pool_;    ///< Declared after engine_: drained before it dies

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::set<std::string> running_;         ///< In-flight registry
    std::vector<Worker> workers_;

    std::string create_stub(const AnalysisRequest& request);
    void launch(const std::string& id, const AnalysisRequest& request);
    bool register_run(const std::string& id);
    void finish_run(const std::string& id);
    void reap_finished_workers();

    // Pipeline stages
    void run_pipeline(const std::string& id, const AnalysisRequest& request);
    bool advance(const std::string& id, AnalysisStatus& status, StageOutcome outcome);
    ClassificationResult classify(const AnalysisRequest& request, const CallContext& ctx);
    FetchResult fetch(const FeedDescriptor& feed, const AnalysisRequest& request, const CallContext& ctx);
    void embed_documents(std::vector<DiscoveryDocument>& documents, const CallContext& ctx);
    DiscoveryResult run_discovery(const DiscoveryRequest& request, const CallContext& ctx);
    void fail(const std::string& id, PipelineStage stage, const std::string& reason);
};

} // namespace nx
