#include "collab/http_collaborators.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>

using json = nlohmann::json;

namespace nx {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

bool is_transient_status(long http_code) {
    return http_code >= 500 || http_code == 429;
}

// Perform one HTTP exchange. A null payload means GET.
std::string http_request(
    const std::string& url,
    const std::string* json_payload,
    long timeout_ms
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw CollaboratorError("Failed to initialize CURL", 0, true);
    }

    std::string response;
    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Accept: application/json");
    if (json_payload) {
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (json_payload) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_payload->size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw CollaboratorError("CURL request failed: " + error, 0, true);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw CollaboratorError(
            "HTTP request failed with code " + std::to_string(http_code) + ": " + response,
            http_code,
            is_transient_status(http_code)
        );
    }

    return response;
}

json parse_body(const std::string& body, const std::string& operation_name) {
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw CollaboratorError(operation_name + " returned malformed JSON: " + e.what(), 200, false);
    }
}

[[noreturn]] void malformed(const std::string& what) {
    throw CollaboratorError("Malformed collaborator payload: " + what, 200, false);
}

std::string required_string(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        malformed(std::string("missing string field '") + key + "'");
    }
    return j[key].get<std::string>();
}

std::string optional_string(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

std::vector<float> parse_vector(const json& j) {
    if (!j.is_array()) {
        malformed("embedding is not an array");
    }
    std::vector<float> v;
    v.reserve(j.size());
    for (const auto& x : j) {
        if (!x.is_number()) {
            malformed("embedding component is not a number");
        }
        v.push_back(x.get<float>());
    }
    return v;
}

std::string join_url(const std::string& base, const std::string& path) {
    if (!base.empty() && base.back() == '/' && !path.empty() && path.front() == '/') {
        return base + path.substr(1);
    }
    return base + path;
}

} // anonymous namespace

// ============================================================================
// Wire Codecs
// ============================================================================

ClassificationResult parse_classification_response(const json& j) {
    if (!j.is_object()) {
        malformed("classification response is not an object");
    }
    ClassificationResult result;
    result.source = required_string(j, "source");
    result.source_type = optional_string(j, "source_type");
    result.suggested_category = optional_string(j, "suggested_category");
    if (j.contains("confidence") && j["confidence"].is_number()) {
        result.confidence = j["confidence"].get<double>();
    }
    if (result.source != "arxiv" && result.source != "reddit") {
        malformed("unsupported source '" + result.source + "'");
    }
    return result;
}

json build_fetch_payload(const FetchRequest& request) {
    json j;
    j["query"] = request.query;
    j["limit"] = request.limit;
    j["source"] = request.source;
    j["category"] = request.category;
    return j;
}

FetchResult parse_fetch_response(const json& j) {
    if (!j.is_object() || !j.contains("articles") || !j["articles"].is_array()) {
        malformed("fetch response has no 'articles' array");
    }

    FetchResult result;
    for (const auto& a : j["articles"]) {
        if (!a.is_object()) {
            malformed("article entry is not an object");
        }
        FetchedDocument doc;
        doc.id = required_string(a, "id");
        doc.title = required_string(a, "title");
        doc.link = optional_string(a, "link");
        doc.summary = optional_string(a, "summary");
        if (doc.summary.empty()) {
            doc.summary = optional_string(a, "content");
        }
        if (a.contains("authors") && a["authors"].is_array()) {
            for (const auto& author : a["authors"]) {
                if (author.is_string()) doc.authors.push_back(author.get<std::string>());
            }
        }
        doc.published = optional_string(a, "published");
        doc.source = optional_string(a, "source");
        if (a.contains("metadata") && a["metadata"].is_object()) {
            doc.metadata = a["metadata"];
        }
        result.articles.push_back(std::move(doc));
    }
    result.total_found = j.value("total_found", static_cast<int>(result.articles.size()));
    result.source = optional_string(j, "source");
    return result;
}

EmbeddingResult parse_embedding_response(const json& j, size_t expected_count) {
    if (!j.is_object() || !j.contains("embeddings") || !j["embeddings"].is_array()) {
        malformed("embedding response has no 'embeddings' array");
    }

    EmbeddingResult result;
    for (const auto& e : j["embeddings"]) {
        result.embeddings.push_back(parse_vector(e));
    }
    if (result.embeddings.size() != expected_count) {
        malformed("expected " + std::to_string(expected_count) + " embeddings, got " +
                  std::to_string(result.embeddings.size()));
    }
    if (!result.embeddings.empty()) {
        size_t dim = result.embeddings.front().size();
        for (const auto& v : result.embeddings) {
            if (v.empty() || v.size() != dim) {
                malformed("embeddings have inconsistent dimensions");
            }
        }
    }
    if (j.contains("cached_count") && j["cached_count"].is_number_integer()) {
        result.cached_count = j["cached_count"].get<int>();
    }
    return result;
}

std::map<std::string, std::vector<float>> parse_embedding_lookup(
    const json& j,
    const std::vector<std::string>& ids
) {
    if (!j.is_object() || !j.contains("embeddings") || !j["embeddings"].is_array()) {
        malformed("embedding lookup has no 'embeddings' array");
    }

    std::map<std::string, std::vector<float>> found;
    const auto& embeddings = j["embeddings"];
    for (size_t i = 0; i < embeddings.size() && i < ids.size(); ++i) {
        if (embeddings[i].is_null()) continue;
        auto v = parse_vector(embeddings[i]);
        if (!v.empty()) {
            found[ids[i]] = std::move(v);
        }
    }
    return found;
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return escaped.str();
}

// ============================================================================
// HttpJsonTransport
// ============================================================================

HttpJsonTransport::HttpJsonTransport(const CollaboratorConfig& config, Exchange exchange)
    : config_(config), exchange_(std::move(exchange)) {
    if (exchange_) return;

    static const CURLcode global_init = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (global_init != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl: " +
                                 std::string(curl_easy_strerror(global_init)));
    }
    exchange_ = http_request;
}

long HttpJsonTransport::timeout_ms_for(const CallContext& ctx) const {
    long long ceiling = static_cast<long long>(config_.timeout_seconds) * 1000;
    return static_cast<long>(std::min(ceiling, ctx.remaining_ms(ceiling)));
}

template<typename Func>
json HttpJsonTransport::retry_call(Func&& func, const CallContext& ctx, const std::string& operation_name) {
    const int max_attempts = std::max(1, config_.max_retries);
    int attempts = 0;
    while (true) {
        if (ctx.expired()) {
            throw CollaboratorError(operation_name + ": pipeline deadline exceeded", 0, false);
        }
        try {
            return func();
        } catch (const CollaboratorError& e) {
            attempts++;
            if (!e.transient() || attempts >= max_attempts) {
                if (attempts > 1) {
                    throw CollaboratorError(
                        operation_name + " failed after " + std::to_string(attempts) +
                        " attempts: " + e.what(), e.http_status(), e.transient());
                }
                throw;
            }

            // Exponential backoff, bounded by the call deadline
            long long backoff = static_cast<long long>(
                config_.retry_backoff_ms * std::pow(2, attempts - 1));
            if (ctx.remaining_ms(backoff + 1) <= backoff) {
                throw CollaboratorError(
                    operation_name + " failed and no time remains for a retry: " + e.what(),
                    e.http_status(), e.transient());
            }

            log::info(config_.verbose, "collab",
                      "[" + ctx.analysis_id + "] Attempt " + std::to_string(attempts) +
                      " failed for " + operation_name + ": " + e.what() + ". Retrying...");

            std::this_thread::sleep_for(std::chrono::milliseconds(backoff));
        }
    }
}

json HttpJsonTransport::post_json(
    const std::string& url,
    const json& payload,
    const CallContext& ctx,
    const std::string& operation_name
) {
    const std::string body = payload.dump();
    return retry_call([&]() {
        long timeout = timeout_ms_for(ctx);
        if (timeout <= 0) {
            throw CollaboratorError(operation_name + ": pipeline deadline exceeded", 0, false);
        }
        return parse_body(exchange_(url, &body, timeout), operation_name);
    }, ctx, operation_name);
}

json HttpJsonTransport::get_json(
    const std::string& url,
    const CallContext& ctx,
    const std::string& operation_name
) {
    return retry_call([&]() {
        long timeout = timeout_ms_for(ctx);
        if (timeout <= 0) {
            throw CollaboratorError(operation_name + ": pipeline deadline exceeded", 0, false);
        }
        return parse_body(exchange_(url, nullptr, timeout), operation_name);
    }, ctx, operation_name);
}

// ============================================================================
// Clients
// ============================================================================

HttpClassificationClient::HttpClassificationClient(std::shared_ptr<HttpJsonTransport> transport)
    : transport_(std::move(transport)) {}

ClassificationResult HttpClassificationClient::classify(const std::string& query, const CallContext& ctx) {
    const auto& cfg = transport_->config();
    json payload = {{"query", query}};
    json response = transport_->post_json(
        join_url(cfg.genai_base_url, cfg.classify_path), payload, ctx, "classify");
    return parse_classification_response(response);
}

HttpArticleFetchClient::HttpArticleFetchClient(std::shared_ptr<HttpJsonTransport> transport)
    : transport_(std::move(transport)) {}

FetchResult HttpArticleFetchClient::fetch_articles(const FetchRequest& request, const CallContext& ctx) {
    const auto& cfg = transport_->config();
    json response = transport_->post_json(
        join_url(cfg.fetcher_base_url, cfg.articles_path), build_fetch_payload(request), ctx, "fetch_articles");
    return parse_fetch_response(response);
}

json HttpArticleFetchClient::list_categories(const std::string& source, const CallContext& ctx) {
    const auto& cfg = transport_->config();
    std::string url = join_url(cfg.fetcher_base_url, cfg.categories_path) + "/" +
                      url_encode(source) + "/categories";
    json response = transport_->get_json(url, ctx, "list_categories");
    if (!response.is_object()) {
        malformed("category listing is not an object");
    }
    return response;
}

HttpEmbeddingClient::HttpEmbeddingClient(std::shared_ptr<HttpJsonTransport> transport)
    : transport_(std::move(transport)) {}

EmbeddingResult HttpEmbeddingClient::embed(
    const std::vector<std::string>& texts,
    const std::vector<std::string>& ids,
    const CallContext& ctx
) {
    if (texts.size() != ids.size()) {
        throw std::invalid_argument("The number of texts and ids must be the same");
    }
    if (texts.empty()) {
        return EmbeddingResult{};
    }
    const auto& cfg = transport_->config();
    json payload = {{"texts", texts}, {"ids", ids}};
    json response = transport_->post_json(
        join_url(cfg.genai_base_url, cfg.embeddings_path), payload, ctx, "embed");
    return parse_embedding_response(response, texts.size());
}

std::map<std::string, std::vector<float>> HttpEmbeddingClient::lookup(
    const std::vector<std::string>& ids,
    const CallContext& ctx
) {
    if (ids.empty()) {
        return {};
    }
    const auto& cfg = transport_->config();
    std::string url = join_url(cfg.genai_base_url, cfg.embeddings_path);
    for (size_t i = 0; i < ids.size(); ++i) {
        url += (i == 0 ? "?ids=" : "&ids=") + url_encode(ids[i]);
    }
    json response = transport_->get_json(url, ctx, "lookup_embeddings");
    return parse_embedding_lookup(response, ids);
}

HttpCollaborators HttpCollaborators::create(const CollaboratorConfig& config) {
    auto transport = std::make_shared<HttpJsonTransport>(config);
    HttpCollaborators c;
    c.classifier = std::make_shared<HttpClassificationClient>(transport);
    c.fetcher = std::make_shared<HttpArticleFetchClient>(transport);
    c.embedder = std::make_shared<HttpEmbeddingClient>(transport);
    return c;
}

} // namespace nx
