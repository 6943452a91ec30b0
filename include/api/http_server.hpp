#pragma once

#include "pipeline/analysis_orchestrator.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace nx {

// ============================================================================
// Routing
// ============================================================================

/**
 * @brief Transport-independent HTTP response
 */
struct ApiResponse {
    int status = 200;
    std::string body;                       ///< JSON, empty for 204
    std::vector<std::pair<std::string, std::string>> headers;
};

/**
 * @brief Maps REST requests onto the orchestrator
 *
 * Every exception is turned into a {code, message, details?} body:
 * InvalidRequest 400, NotFound 404, CollaboratorError 502,
 * PipelineTimeout 504, anything else 500.
 */
class ApiRouter {
public:
    explicit ApiRouter(AnalysisOrchestrator& orchestrator, bool verbose = false);

    ApiResponse handle_request(
        const std::string& method,
        const std::string& target,
        const std::string& body
    );

    /// Decoded query-string parameters of a request target.
    static std::map<std::string, std::string> parse_query(const std::string& target);

private:
    AnalysisOrchestrator& orchestrator_;
    bool verbose_;

    ApiResponse route(const std::string& method, const std::string& path,
                      const std::map<std::string, std::string>& params, const std::string& body);

    ApiResponse submit_analysis(const std::string& body);
    ApiResponse get_analysis(const std::string& id);
    ApiResponse list_analyses(const std::map<std::string, std::string>& params);
    ApiResponse delete_analysis(const std::string& id);
    ApiResponse discover_topics(const std::string& body);
    ApiResponse similar_topics(const std::string& topic_id, const std::map<std::string, std::string>& params);
    ApiResponse list_categories(const std::string& source);
};

/// {code, message, details?} body with the given status.
ApiResponse error_response(int status, const std::string& code, const std::string& message,
                           const std::string& details = "");

// ============================================================================
// Server
// ============================================================================

/**
 * @brief Boost.Beast HTTP/1.1 server
 *
 * Connections are accepted asynchronously on one io_context; each
 * connection is served synchronously on its own detached thread, so a slow
 * client never blocks the accept loop. SIGINT and SIGTERM stop the server.
 */
class HttpServer {
public:
    HttpServer(ApiRouter& router, const std::string& address, unsigned short port, bool verbose = false);

    /// Closes and joins any connection still open.
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Serve until stop() or a termination signal
     *
     * Open connections are shut down and their threads joined before
     * returning, so the router may be destroyed afterwards.
     */
    void run();

    void stop();

    /// Bound port; useful when constructed with port 0.
    unsigned short port() const;

    /// Connection threads not yet joined.
    size_t open_connections() const;

private:
    struct Connection {
        std::shared_ptr<boost::asio::ip::tcp::socket> socket;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    ApiRouter& router_;
    bool verbose_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex connections_mutex_;
    std::vector<Connection> connections_;

    void do_accept();
    void serve_connection(boost::asio::ip::tcp::socket& socket);
    void reap_finished_connections();
    void close_connections();
};

} // namespace nx
