#include "api/http_server.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <csignal>
#include <iterator>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

namespace nx {

namespace {

constexpr const char* kAnalysesPath = "/api/v1/analyses";
constexpr const char* kTopicsPath = "/api/v1/topics/";
constexpr const char* kSourcesPath = "/api/v1/sources/";
constexpr int kDefaultPageSize = 20;
constexpr int kDefaultSimilarLimit = 5;

std::string url_decode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < value.size() &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

int int_param(const std::map<std::string, std::string>& params, const std::string& key, int fallback) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) return fallback;
    try {
        size_t consumed = 0;
        int value = std::stoi(it->second, &consumed);
        if (consumed != it->second.size()) throw std::invalid_argument(key);
        return value;
    } catch (const std::exception&) {
        throw InvalidRequest("'" + key + "' must be an integer");
    }
}

json parse_body(const std::string& body) {
    if (body.empty()) {
        throw InvalidRequest("Request body is required");
    }
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw InvalidRequest(std::string("Malformed JSON body: ") + e.what());
    }
}

ApiResponse json_response(int status, const json& body) {
    ApiResponse response;
    response.status = status;
    response.body = body.dump();
    return response;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

ApiResponse error_response(int status, const std::string& code, const std::string& message,
                           const std::string& details) {
    json body = {{"code", code}, {"message", message}};
    if (!details.empty()) body["details"] = details;
    return json_response(status, body);
}

// ============================================================================
// ApiRouter
// ============================================================================

ApiRouter::ApiRouter(AnalysisOrchestrator& orchestrator, bool verbose)
    : orchestrator_(orchestrator), verbose_(verbose) {}

std::map<std::string, std::string> ApiRouter::parse_query(const std::string& target) {
    std::map<std::string, std::string> params;
    size_t q = target.find('?');
    if (q == std::string::npos) return params;

    std::string query = target.substr(q + 1);
    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                params[url_decode(pair)] = "";
            } else {
                params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        start = end + 1;
    }
    return params;
}

ApiResponse ApiRouter::handle_request(
    const std::string& method,
    const std::string& target,
    const std::string& body
) {
    std::string path = target.substr(0, target.find('?'));
    while (path.size() > 1 && path.back() == '/') path.pop_back();

    ApiResponse response;
    try {
        response = route(method, path, parse_query(target), body);
    } catch (const InvalidRequest& e) {
        response = error_response(400, "INVALID_REQUEST", e.what());
    } catch (const NotFound& e) {
        response = error_response(404, "NOT_FOUND", e.what());
    } catch (const CollaboratorError& e) {
        response = error_response(502, "BAD_GATEWAY", "Upstream collaborator failed", e.what());
    } catch (const PipelineTimeout& e) {
        response = error_response(504, "TIMEOUT", e.what());
    } catch (const DiscoveryFailure& e) {
        response = error_response(400, "INVALID_REQUEST", "Topic discovery rejected the input", e.what());
    } catch (const std::exception& e) {
        log::error("http", method + " " + path + ": " + e.what());
        response = error_response(500, "INTERNAL_ERROR", "Internal server error");
    }

    log::info(verbose_, "http", method + " " + path + " -> " + std::to_string(response.status));
    return response;
}

ApiResponse ApiRouter::route(
    const std::string& method,
    const std::string& path,
    const std::map<std::string, std::string>& params,
    const std::string& body
) {
    const std::string analyses = kAnalysesPath;

    if (path == "/health") {
        if (method != "GET") return error_response(405, "METHOD_NOT_ALLOWED", "Use GET");
        return json_response(200, {{"status", "healthy"}});
    }

    if (path == analyses) {
        if (method == "POST") return submit_analysis(body);
        if (method == "GET") return list_analyses(params);
        return error_response(405, "METHOD_NOT_ALLOWED", "Use GET or POST");
    }

    if (starts_with(path, analyses + "/")) {
        std::string id = path.substr(analyses.size() + 1);
        if (id.empty() || id.find('/') != std::string::npos) {
            return error_response(404, "NOT_FOUND", "No route for " + path);
        }
        if (method == "GET") return get_analysis(id);
        if (method == "DELETE") return delete_analysis(id);
        return error_response(405, "METHOD_NOT_ALLOWED", "Use GET or DELETE");
    }

    if (path == std::string(kTopicsPath) + "discover") {
        if (method != "POST") return error_response(405, "METHOD_NOT_ALLOWED", "Use POST");
        return discover_topics(body);
    }

    if (starts_with(path, kTopicsPath)) {
        std::string rest = path.substr(std::string(kTopicsPath).size());
        const std::string suffix = "/similar";
        if (rest.size() > suffix.size() && rest.compare(rest.size() - suffix.size(), suffix.size(), suffix) == 0) {
            if (method != "GET") return error_response(405, "METHOD_NOT_ALLOWED", "Use GET");
            return similar_topics(rest.substr(0, rest.size() - suffix.size()), params);
        }
    }

    if (starts_with(path, kSourcesPath)) {
        std::string rest = path.substr(std::string(kSourcesPath).size());
        const std::string suffix = "/categories";
        if (rest.size() > suffix.size() && rest.compare(rest.size() - suffix.size(), suffix.size(), suffix) == 0) {
            if (method != "GET") return error_response(405, "METHOD_NOT_ALLOWED", "Use GET");
            return list_categories(rest.substr(0, rest.size() - suffix.size()));
        }
    }

    return error_response(404, "NOT_FOUND", "No route for " + path);
}

// ============================================================================
// Handlers
// ============================================================================

ApiResponse ApiRouter::submit_analysis(const std::string& body) {
    AnalysisRequest request = AnalysisRequest::from_json(parse_body(body));
    std::string id = orchestrator_.submit_analysis(request);

    ApiResponse response = json_response(202, {{"id", id}});
    response.headers.emplace_back("Location", std::string(kAnalysesPath) + "/" + id);
    return response;
}

ApiResponse ApiRouter::get_analysis(const std::string& id) {
    return json_response(200, analysis_to_json(orchestrator_.get_analysis(id)));
}

ApiResponse ApiRouter::list_analyses(const std::map<std::string, std::string>& params) {
    AnalysisPage page = orchestrator_.list_analyses(
        int_param(params, "limit", kDefaultPageSize),
        int_param(params, "offset", 0));

    json items = json::array();
    for (const auto& analysis : page.items) {
        items.push_back(analysis_to_json(analysis, false));
    }
    return json_response(200, {
        {"total", page.total},
        {"limit", page.limit},
        {"offset", page.offset},
        {"items", items}
    });
}

ApiResponse ApiRouter::delete_analysis(const std::string& id) {
    orchestrator_.delete_analysis(id);
    ApiResponse response;
    response.status = 204;
    return response;
}

ApiResponse ApiRouter::discover_topics(const std::string& body) {
    TopicDiscoveryInput input = TopicDiscoveryInput::from_json(parse_body(body));
    DiscoveryResult result = orchestrator_.discover_topics(input);
    return json_response(200, discovery_result_to_json(result, input.articles));
}

ApiResponse ApiRouter::similar_topics(const std::string& topic_id, const std::map<std::string, std::string>& params) {
    auto similar = orchestrator_.similar_topics(topic_id, int_param(params, "limit", kDefaultSimilarLimit));

    json items = json::array();
    for (const auto& s : similar) {
        items.push_back({
            {"id", s.topic.id},
            {"analysis_id", s.topic.analysis_id},
            {"title", s.topic.title},
            {"description", s.topic.description},
            {"article_count", s.topic.article_count},
            {"relevance", s.topic.relevance},
            {"similarity", s.similarity}
        });
    }
    return json_response(200, {{"topic_id", topic_id}, {"items", items}});
}

ApiResponse ApiRouter::list_categories(const std::string& source) {
    return json_response(200, orchestrator_.list_categories(source));
}

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(ApiRouter& router, const std::string& address, unsigned short port, bool verbose)
    : router_(router)
    , verbose_(verbose)
    , acceptor_(ioc_) {
    tcp::endpoint endpoint(asio::ip::make_address(address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
}

HttpServer::~HttpServer() {
    close_connections();
}

unsigned short HttpServer::port() const {
    return acceptor_.local_endpoint().port();
}

size_t HttpServer::open_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void HttpServer::run() {
    asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const beast::error_code& ec, int signal_number) {
        if (!ec) {
            log::info(true, "server", "Received signal " + std::to_string(signal_number) + ", shutting down");
            stop();
        }
    });

    log::info(true, "server", "Listening on " + acceptor_.local_endpoint().address().to_string() +
                              ":" + std::to_string(port()));
    do_accept();
    ioc_.run();
    close_connections();
}

void HttpServer::stop() {
    stopping_ = true;
    asio::post(ioc_, [this]() {
        beast::error_code ec;
        acceptor_.close(ec);
        if (ec) log::warn("server", "Closing acceptor: " + ec.message());
        ioc_.stop();
    });
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (!stopping_) log::warn("server", "Accept failed: " + ec.message());
        } else {
            reap_finished_connections();
            auto shared_socket = std::make_shared<tcp::socket>(std::move(socket));
            auto done = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.push_back({shared_socket, done, std::thread([this, shared_socket, done]() {
                serve_connection(*shared_socket);
                *done = true;
            })});
        }
        if (!stopping_) do_accept();
    });
}

void HttpServer::reap_finished_connections() {
    std::vector<Connection> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto split = std::stable_partition(connections_.begin(), connections_.end(),
                                           [](const Connection& c) { return !*c.done; });
        std::move(split, connections_.end(), std::back_inserter(finished));
        connections_.erase(split, connections_.end());
    }
    for (auto& conn : finished) conn.thread.join();
}

void HttpServer::close_connections() {
    std::vector<Connection> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        open.swap(connections_);
    }
    if (!open.empty()) {
        log::info(verbose_, "server", "Closing " + std::to_string(open.size()) + " open connection(s)");
    }
    // Shutdown wakes a thread blocked reading the next keep-alive request
    for (auto& conn : open) {
        if (*conn.done) continue;
        beast::error_code ec;
        conn.socket->shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected) {
            log::info(verbose_, "server", "Connection shutdown: " + ec.message());
        }
    }
    for (auto& conn : open) conn.thread.join();
}

void HttpServer::serve_connection(tcp::socket& socket) {
    beast::error_code ec;
    beast::flat_buffer buffer;

    for (;;) {
        http::request<http::string_body> req;
        http::read(socket, buffer, req, ec);
        if (ec == http::error::end_of_stream) break;
        if (ec) {
            log::info(verbose_, "server", "Read failed: " + ec.message());
            break;
        }

        ApiResponse api = router_.handle_request(
            std::string(req.method_string()), std::string(req.target()), req.body());

        http::response<http::string_body> res{static_cast<http::status>(api.status), req.version()};
        res.set(http::field::server, "nx");
        if (!api.body.empty()) {
            res.set(http::field::content_type, "application/json");
            res.body() = api.body;
        }
        for (const auto& header : api.headers) {
            res.set(header.first, header.second);
        }
        res.keep_alive(req.keep_alive());
        res.prepare_payload();

        http::write(socket, res, ec);
        if (ec) {
            log::info(verbose_, "server", "Write failed: " + ec.message());
            break;
        }
        if (!res.keep_alive()) break;
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace nx
