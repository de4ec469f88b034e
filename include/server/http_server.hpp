#pragma once

#include "core/pipeline.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace urlscope {

class ShutdownCoordinator;

/**
 * @brief HTTP front end for the screenshot pipeline
 *
 * Routes:
 * - POST /screenshot  {"url": "..."} -> ScreenshotRequestResult as JSON
 * - GET  /health      pool occupancy and uptime
 *
 * Port 0 binds an ephemeral port; bound_port() reports it once listening.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<Pipeline> pipeline,
               std::string host = "0.0.0.0",
               int port = 8080,
               size_t thread_pool_size = 8);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, register routes and serve until stop()
     * @throws std::runtime_error if the address cannot be bound
     */
    void start();
    void stop();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] int bound_port() const;

    void set_shutdown_coordinator(std::shared_ptr<ShutdownCoordinator> sc) {
        shutdown_coordinator_ = std::move(sc);
    }

    // ── Response mapping (stateless) ────────────────────────────────────

    /**
     * @brief HTTP status for a pipeline result
     *
     * 200 success or partial capture failure, 400 malformed input,
     * 429 queue full, 503 pool timeout / session creation failure / draining,
     * 500 anything else.
     */
    [[nodiscard]] static int status_for(const ScreenshotRequestResult& result);

    [[nodiscard]] static std::string to_json(const ScreenshotRequestResult& result);

    [[nodiscard]] static std::string health_json(const SessionPoolHealth& health,
                                                 std::chrono::seconds uptime);

private:
    void register_routes(httplib::Server& svr);

    void handle_screenshot(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<Pipeline> pipeline_;
    const std::string host_;
    const int port_;
    const size_t thread_pool_size_;
    const std::chrono::steady_clock::time_point started_at_;

    mutable std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
    int bound_port_ = 0;

    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;
};

} // namespace urlscope
