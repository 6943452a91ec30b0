#pragma once

#include "collab/collaborators.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace nx {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Endpoints and retry policy shared by the HTTP collaborator clients
 */
struct CollaboratorConfig {
    std::string genai_base_url = "http://localhost:8000";     ///< Classification + embeddings
    std::string fetcher_base_url = "http://localhost:8200";   ///< Article fetch
    std::string classify_path = "/api/v1/classify";
    std::string articles_path = "/api/v1/articles";
    std::string embeddings_path = "/api/v1/embeddings";
    std::string categories_path = "/api/v1/sources";
    int timeout_seconds = 60;               ///< Per-call ceiling, clamped by the call deadline
    int max_retries = 3;                    ///< Total attempts for transient failures
    int retry_backoff_ms = 250;             ///< First backoff; doubled per attempt
    bool verbose = false;
};

// ============================================================================
// Transport
// ============================================================================

/**
 * @brief JSON-over-HTTP transport built on libcurl
 *
 * Transient failures (transport errors, 5xx, 429) are retried with
 * exponential backoff, never past the call deadline. Everything else raises
 * CollaboratorError on the first attempt.
 */
class HttpJsonTransport {
public:
    /**
     * @brief One HTTP exchange returning the 2xx response body
     *
     * A null payload means GET. Failures raise CollaboratorError with the
     * HTTP status and transient flag.
     */
    using Exchange = std::function<std::string(
        const std::string& url, const std::string* json_payload, long timeout_ms)>;

    /// An empty exchange selects libcurl.
    explicit HttpJsonTransport(const CollaboratorConfig& config, Exchange exchange = Exchange());

    nlohmann::json post_json(
        const std::string& url,
        const nlohmann::json& payload,
        const CallContext& ctx,
        const std::string& operation_name
    );

    nlohmann::json get_json(
        const std::string& url,
        const CallContext& ctx,
        const std::string& operation_name
    );

    const CollaboratorConfig& config() const { return config_; }

private:
    CollaboratorConfig config_;
    Exchange exchange_;

    template<typename Func>
    nlohmann::json retry_call(Func&& func, const CallContext& ctx, const std::string& operation_name);

    long timeout_ms_for(const CallContext& ctx) const;
};

// ============================================================================
// Clients
// ============================================================================

class HttpClassificationClient : public ClassificationClient {
public:
    explicit HttpClassificationClient(std::shared_ptr<HttpJsonTransport> transport);

    ClassificationResult classify(const std::string& query, const CallContext& ctx) override;

private:
    std::shared_ptr<HttpJsonTransport> transport_;
};

class HttpArticleFetchClient : public ArticleFetchClient {
public:
    explicit HttpArticleFetchClient(std::shared_ptr<HttpJsonTransport> transport);

    FetchResult fetch_articles(const FetchRequest& request, const CallContext& ctx) override;
    nlohmann::json list_categories(const std::string& source, const CallContext& ctx) override;

private:
    std::shared_ptr<HttpJsonTransport> transport_;
};

class HttpEmbeddingClient : public EmbeddingClient {
public:
    explicit HttpEmbeddingClient(std::shared_ptr<HttpJsonTransport> transport);

    EmbeddingResult embed(
        const std::vector<std::string>& texts,
        const std::vector<std::string>& ids,
        const CallContext& ctx
    ) override;

    std::map<std::string, std::vector<float>> lookup(
        const std::vector<std::string>& ids,
        const CallContext& ctx
    ) override;

private:
    std::shared_ptr<HttpJsonTransport> transport_;
};

// ============================================================================
// Wire Codecs
// ============================================================================
//
// Payload parsing is separated from the transport so malformed collaborator
// responses can be exercised without a server. All parsers throw
// CollaboratorError (non-transient) on missing or mistyped fields.

ClassificationResult parse_classification_response(const nlohmann::json& j);
nlohmann::json build_fetch_payload(const FetchRequest& request);
FetchResult parse_fetch_response(const nlohmann::json& j);
EmbeddingResult parse_embedding_response(const nlohmann::json& j, size_t expected_count);
std::map<std::string, std::vector<float>> parse_embedding_lookup(
    const nlohmann::json& j,
    const std::vector<std::string>& ids
);

/// Percent-encodes a query-string component.
std::string url_encode(const std::string& value);

/**
 * @brief Classification and embedding clients on the GenAI base URL, fetch
 * client on the fetcher base URL, all sharing one transport
 */
struct HttpCollaborators {
    std::shared_ptr<ClassificationClient> classifier;
    std::shared_ptr<ArticleFetchClient> fetcher;
    std::shared_ptr<EmbeddingClient> embedder;

    static HttpCollaborators create(const CollaboratorConfig& config);
};

} // namespace nx
