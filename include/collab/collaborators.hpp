#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nx {

// ============================================================================
// Call Context
// ============================================================================

/**
 * @brief Per-call context handed to every collaborator
 *
 * Carries the analysis id for log correlation and the pipeline deadline;
 * clients clamp their own timeouts to the time remaining.
 */
struct CallContext {
    using Clock = std::chrono::steady_clock;

    std::string analysis_id;
    std::optional<Clock::time_point> deadline;

    static CallContext unbounded(const std::string& analysis_id = "") {
        CallContext ctx;
        ctx.analysis_id = analysis_id;
        return ctx;
    }

    static CallContext with_budget(const std::string& analysis_id, std::chrono::milliseconds budget) {
        CallContext ctx;
        ctx.analysis_id = analysis_id;
        ctx.deadline = Clock::now() + budget;
        return ctx;
    }

    bool expired() const {
        return deadline && Clock::now() >= *deadline;
    }

    /// Milliseconds left before the deadline, or `fallback` when unbounded.
    long long remaining_ms(long long fallback) const {
        if (!deadline) return fallback;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
        return left < 0 ? 0 : left;
    }
};

// ============================================================================
// Typed Stage Records
// ============================================================================

/**
 * @brief Classification collaborator verdict for a query
 */
struct ClassificationResult {
    std::string source;                     ///< "arxiv" or "reddit"
    std::string source_type;                ///< "research" or "community"; may be empty
    std::string suggested_category;         ///< e.g. "cs.CL", "cat:cs.LG+AND+all:llm", "MachineLearning"
    std::optional<double> confidence;
};

/**
 * @brief Fetch request sent to the article fetch collaborator
 */
struct FetchRequest {
    std::string source;
    std::string category;
    std::string query;
    int limit = 100;
};

/**
 * @brief One document returned by the fetch collaborator
 */
struct FetchedDocument {
    std::string id;                         ///< Source-stable external id
    std::string title;
    std::string link;
    std::string summary;
    std::vector<std::string> authors;
    std::string published;
    std::string source;
    nlohmann::json metadata = nlohmann::json::object();
};

struct FetchResult {
    std::vector<FetchedDocument> articles;
    int total_found = 0;
    std::string source;
};

struct EmbeddingResult {
    std::vector<std::vector<float>> embeddings;  ///< Aligned with the request texts
    int cached_count = 0;
};

// ============================================================================
// Collaborator Interfaces
// ============================================================================

/**
 * @brief Maps a free-text query to a source, source type and category
 */
class ClassificationClient {
public:
    virtual ~ClassificationClient() = default;

    virtual ClassificationResult classify(const std::string& query, const CallContext& ctx) = 0;
};

/**
 * @brief Fetches candidate documents for a source descriptor
 */
class ArticleFetchClient {
public:
    virtual ~ArticleFetchClient() = default;

    virtual FetchResult fetch_articles(const FetchRequest& request, const CallContext& ctx) = 0;

    /**
     * @brief Category groups offered by a source, e.g. {"Computer Science": ["cs.AI", ...]}
     */
    virtual nlohmann::json list_categories(const std::string& source, const CallContext& ctx) = 0;
};

/**
 * @brief Turns texts into fixed-dimension vectors
 */
class EmbeddingClient {
public:
    virtual ~EmbeddingClient() = default;

    /**
     * @brief Embed texts; ids let the collaborator cache by document
     *
     * @return One vector per text, in request order
     */
    virtual EmbeddingResult embed(
        const std::vector<std::string>& texts,
        const std::vector<std::string>& ids,
        const CallContext& ctx
    ) = 0;

    /**
     * @brief Cached vectors by document id; ids without a cached vector are absent
     */
    virtual std::map<std::string, std::vector<float>> lookup(
        const std::vector<std::string>& ids,
        const CallContext& ctx
    ) = 0;
};

} // namespace nx
