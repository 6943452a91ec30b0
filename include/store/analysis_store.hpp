#pragma once

#include "model/analysis.hpp"
#include <optional>
#include <string>
#include <vector>

namespace nx {

/**
 * @brief Stored topic ranked by centroid similarity to another topic
 */
struct SimilarTopic {
    Topic topic;                            ///< Without articles
    double similarity = 0.0;                ///< Cosine similarity of the centroids
};

/**
 * @brief Durable storage of analyses, topics and articles
 *
 * Every write is idempotent. Status updates are monotonic along the
 * pipeline's forward path and never leave a terminal state. Implementations
 * are safe to call from several pipeline threads at once.
 */
class AnalysisStore {
public:
    virtual ~AnalysisStore() = default;

    /// Insert a PENDING stub; a second insert of the same id is a no-op.
    virtual void create_analysis(const Analysis& stub) = 0;

    /**
     * @brief Advance the status
     *
     * @return false when the analysis is gone, already terminal, or the
     *         new status does not rank after the stored one
     */
    virtual bool update_status(const std::string& id, AnalysisStatus status) = 0;

    virtual bool update_classification(const std::string& id, AnalysisType type, const std::string& feed_url) = 0;

    /// Move a non-terminal analysis to FAILED and record the operator-facing reason.
    virtual bool mark_failed(const std::string& id, const std::string& stage, const std::string& reason) = 0;

    /**
     * @brief Persist topics, articles and associations, then mark COMPLETED
     *
     * Runs in one transaction. Articles are deduplicated globally by
     * external_id.
     *
     * @return false (nothing written) when the analysis no longer exists or
     *         is already terminal
     * @throws PersistenceFailure on storage errors, after rolling back
     */
    virtual bool commit_results(const std::string& id, const std::vector<Topic>& topics, int total_articles_processed) = 0;

    /// Returns the storage id of the article with this external_id, inserting it if new.
    virtual std::string upsert_article(const Article& article) = 0;

    /// Full view with topics and their articles; article_count recomputed.
    virtual std::optional<Analysis> get_analysis(const std::string& id) = 0;

    /// Summaries (no topics), newest first.
    virtual std::vector<Analysis> list_analyses(int limit, int offset) = 0;

    virtual int count_analyses() = 0;

    /// Removes the analysis, its topics and associations; shared articles survive.
    virtual bool delete_analysis(const std::string& id) = 0;

    virtual int count_articles() = 0;

    /**
     * @brief Topics of other analyses closest to the given topic's centroid
     *
     * @throws NotFound when the topic does not exist
     */
    virtual std::vector<SimilarTopic> find_similar_topics(const std::string& topic_id, int limit) = 0;
};

} // namespace nx
