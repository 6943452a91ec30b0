#pragma once

#include "discovery/reduction.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace nx {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Topic discovery configuration
 */
struct DiscoveryConfig {
    int min_cluster_size = 2;               ///< Default when the request names none
    std::optional<int> min_samples;         ///< Default: min(min_cluster_size, neighbours)
    double oversize_factor = 2.0;           ///< Split clusters larger than factor x median
    int max_subcluster_depth = 2;
    int max_articles_per_topic = 75;
    ReductionConfig reduction;
    bool verbose = false;
};

// ============================================================================
// Request / Result
// ============================================================================

struct DiscoveryDocument {
    std::string id;                         ///< External id
    std::string title;
    std::string summary;
    std::string link;
    std::vector<float> embedding;           ///< Documents without one are skipped
    nlohmann::json metadata = nlohmann::json::object();
};

struct DiscoveryRequest {
    std::string query;
    std::vector<DiscoveryDocument> documents;
    std::optional<int> target_topic_count;
    std::optional<int> min_cluster_size;
};

/**
 * @brief One labeled, scored topic
 */
struct DiscoveredTopic {
    std::string id;
    std::string title;
    std::string description;
    std::vector<std::string> keywords;
    int relevance = 0;                      ///< 0-100
    int cluster_size = 0;                   ///< Members before the per-topic cap
    double cohesion = 0.0;                  ///< Mean cosine similarity to the centroid
    double membership = 0.0;                ///< Mean cluster membership strength
    std::vector<float> centroid;            ///< Mean normalised embedding
    std::vector<size_t> members;            ///< Indices into the request documents, most central first, capped
};

struct DiscoveryResult {
    std::string query;
    std::vector<DiscoveredTopic> topics;    ///< Ranked
    int total_articles_processed = 0;       ///< Documents that carried an embedding
};

// ============================================================================
// Engine
// ============================================================================

/**
 * @brief Turns a batch of embedded documents into ranked, labeled topics
 *
 * Reduction, density clustering, optional merge toward a target count,
 * sub-clustering of oversized clusters, labeling and relevance scoring.
 * Stateless; discover() may run concurrently on one instance.
 */
class TopicDiscoveryEngine {
public:
    explicit TopicDiscoveryEngine(const DiscoveryConfig& config = DiscoveryConfig());

    /**
     * @brief Run discovery
     *
     * @throws DiscoveryFailure on inconsistent embedding dimensions or
     *         invalid parameters
     */
    DiscoveryResult discover(const DiscoveryRequest& request) const;

    const DiscoveryConfig& config() const { return config_; }

    /// raw = (size / largest) * (0.6 + 0.4 * confidence)
    static double raw_relevance(int size, int largest_size, double confidence);

    /// Sort key: relevance desc, cluster size desc, title asc.
    static void rank_topics(std::vector<DiscoveredTopic>& topics);

    using Cluster = std::vector<size_t>;    ///< Row indices into the usable-document matrix

    /**
     * @brief Re-cluster clusters larger than oversize_factor x median
     *
     * A split is kept only when every sub-cluster reaches min_cluster_size
     * and the total stays within target. Repeats up to max_subcluster_depth.
     * Exposed for tests.
     */
    void split_oversized(
        std::vector<Cluster>& clusters,
        const std::vector<std::vector<float>>& embeddings,
        int min_cluster_size,
        int min_samples,
        std::optional<int> target
    ) const;

private:
    DiscoveryConfig config_;

    std::vector<Cluster> cluster_points(
        const Eigen::MatrixXd& points,
        int min_cluster_size,
        int min_samples,
        std::vector<double>& membership
    ) const;

    void merge_to_target(
        std::vector<Cluster>& clusters,
        const Eigen::MatrixXd& points,
        int target
    ) const;
};

} // namespace nx
