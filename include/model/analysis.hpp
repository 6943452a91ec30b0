#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nx {

// ============================================================================
// Analysis Status
// ============================================================================

/**
 * @brief Position of an analysis on the pipeline's single forward path
 *
 * The enumerator order is the rank order; FAILED ranks after every
 * non-terminal state so it can be reached from any of them.
 */
enum class AnalysisStatus {
    PENDING,
    CLASSIFYING,
    FETCHING_ARTICLES,
    EMBEDDING_ARTICLES,
    DISCOVERING_TOPICS,
    COMPLETED,
    FAILED
};

inline std::string status_to_string(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::PENDING: return "PENDING";
        case AnalysisStatus::CLASSIFYING: return "CLASSIFYING";
        case AnalysisStatus::FETCHING_ARTICLES: return "FETCHING_ARTICLES";
        case AnalysisStatus::EMBEDDING_ARTICLES: return "EMBEDDING_ARTICLES";
        case AnalysisStatus::DISCOVERING_TOPICS: return "DISCOVERING_TOPICS";
        case AnalysisStatus::COMPLETED: return "COMPLETED";
        case AnalysisStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

/// Throws std::invalid_argument for names outside the state machine.
AnalysisStatus string_to_status(const std::string& s);

inline int status_rank(AnalysisStatus status) {
    return static_cast<int>(status);
}

inline bool is_terminal(AnalysisStatus status) {
    return status == AnalysisStatus::COMPLETED || status == AnalysisStatus::FAILED;
}

// ============================================================================
// Analysis Type
// ============================================================================

enum class AnalysisType {
    RESEARCH,
    COMMUNITY
};

inline std::string analysis_type_to_string(AnalysisType type) {
    return type == AnalysisType::COMMUNITY ? "community" : "research";
}

/// Accepts "research"/"community" in any case; throws std::invalid_argument otherwise.
AnalysisType string_to_analysis_type(const std::string& s);

// ============================================================================
// Records
// ============================================================================

/**
 * @brief Source document, deduplicated globally by external_id
 */
struct Article {
    std::string id;                         ///< Storage id (UUID)
    std::string external_id;                ///< Source-stable id from the fetch collaborator
    std::string title;
    std::string link;
    std::string snippet;
    std::vector<float> embedding;           ///< Empty when unknown
};

/**
 * @brief Labeled cluster of articles produced by one discovery run
 */
struct Topic {
    std::string id;
    std::string analysis_id;
    std::string title;
    std::string description;
    int article_count = 0;                  ///< Live association count on read
    int relevance = 0;                      ///< 0-100, fixed at discovery time
    std::vector<float> embedding;           ///< Cluster centroid, may be empty
    std::vector<Article> articles;          ///< Ordered by centrality
};

/**
 * @brief One submitted query and its pipeline state
 */
struct Analysis {
    std::string id;
    std::string query;
    std::optional<AnalysisType> type;       ///< Unknown until classified
    std::string feed_url;                   ///< Resolved source descriptor
    int total_articles_processed = 0;
    AnalysisStatus status = AnalysisStatus::PENDING;
    int64_t created_at_ms = 0;              ///< UTC epoch milliseconds

    // Operator-only failure details, never part of the public JSON view
    std::string failure_stage;
    std::string failure_reason;

    std::vector<Topic> topics;
};

// ============================================================================
// Utilities
// ============================================================================

/// Random (version 4) UUID in canonical lower-case form.
std::string generate_uuid();

/// Current UTC time in epoch milliseconds.
int64_t now_millis();

/// ISO-8601 UTC rendering with millisecond precision, e.g. 2024-05-01T10:00:00.250Z
std::string format_timestamp(int64_t epoch_ms);

// ============================================================================
// JSON views (public API shape)
// ============================================================================

void to_json(nlohmann::json& j, const Article& article);
void to_json(nlohmann::json& j, const Topic& topic);

/**
 * @brief Public JSON view of an analysis
 *
 * @param include_topics false for the list (summary) view
 */
nlohmann::json analysis_to_json(const Analysis& analysis, bool include_topics = true);

} // namespace nx
