#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "core/base64.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace urlscope {

// ============================================================================
// Anonymous namespace helpers
// ============================================================================

namespace {

std::string json_string(std::string_view s) {
    return std::format("\"{}\"", utils::escape_json(s));
}

std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += json_string(items[i]);
    }
    out += ']';
    return out;
}

std::string json_screenshot(const std::optional<std::vector<uint8_t>>& png) {
    if (!png) return "null";
    return std::format("\"{}\"", base64::encode(png->data(), png->size()));
}

std::string identifier_json(const Identifier& id) {
    const char* component =
        id.location.component == IdentifierLocation::Component::QUERY ? "query" : "path";
    return std::format(
        R"({{"raw":{},"decoded":{},"kind":"{}","anonymized":{},)"
        R"("location":{{"component":"{}","index":{},"key":{}}}}})",
        json_string(id.raw),
        id.decoded ? json_string(*id.decoded) : "null",
        identifier_kind_to_string(id.kind),
        json_string(id.anonymized),
        component, id.location.index,
        id.location.component == IdentifierLocation::Component::QUERY
            ? json_string(id.location.key) : "null");
}

std::string json_optional_string(const std::optional<std::string>& s) {
    return s ? json_string(*s) : "null";
}

std::string certificate_json(const std::optional<CertificateInfo>& cert) {
    if (!cert) return "null";
    return std::format(
        R"({{"host":{},"issuer":{},"subject":{},"valid_from":"{}","valid_to":"{}",)"
        R"("days_remaining":{},"version":{},"serial_number":{},"security_status":"{}"}})",
        json_string(cert->host), json_string(cert->issuer), json_string(cert->subject),
        utils::iso8601_utc(cert->valid_from), utils::iso8601_utc(cert->valid_to),
        cert->days_remaining, cert->version, json_string(cert->serial_number),
        certificate_status_to_string(cert->status));
}

std::string whois_json(const std::optional<WhoisInfo>& whois) {
    if (!whois) return "null";
    return std::format(
        R"({{"domain":{},"server":{},"organisation":{},"registrar":{},)"
        R"("created":{},"changed":{},"expires":{}}})",
        json_string(whois->domain), json_string(whois->server),
        json_optional_string(whois->organisation), json_optional_string(whois->registrar),
        json_optional_string(whois->created), json_optional_string(whois->changed),
        json_optional_string(whois->expires));
}

void send_error(httplib::Response& res, int status, std::string_view message) {
    res.status = status;
    res.set_content(std::format(R"({{"status":"error","message":{}}})", json_string(message)),
                    http::kJsonContentType);
}

// RAII guard for shutdown coordinator
struct ShutdownGuard {
    ShutdownCoordinator* sc;
    ~ShutdownGuard() { if (sc) sc->leave_request(); }
};

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<Pipeline> pipeline,
                       std::string host,
                       int port,
                       size_t thread_pool_size)
    : pipeline_(std::move(pipeline)),
      host_(std::move(host)),
      port_(port),
      thread_pool_size_(thread_pool_size == 0 ? 1 : thread_pool_size),
      started_at_(std::chrono::steady_clock::now()) {
    if (!pipeline_) {
        throw std::invalid_argument("HttpServer requires a pipeline");
    }
}

HttpServer::~HttpServer() = default;

// ============================================================================
// start(): create server, register routes, listen
// ============================================================================

void HttpServer::start() {
    httplib::Server* svr = nullptr;
    {
        std::lock_guard lock(server_mutex_);
        if (server_) {
            throw std::logic_error("HttpServer already started");
        }
        server_ = std::make_unique<httplib::Server>();
        svr = server_.get();
    }

    // Configure thread pool size
    const size_t pool_size = thread_pool_size_;
    svr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(*svr);

    int port = port_;
    if (port == 0) {
        port = svr->bind_to_any_port(host_);
        if (port <= 0) {
            throw std::runtime_error(std::format("Failed to bind HTTP server on {}", host_));
        }
    } else if (!svr->bind_to_port(host_, port)) {
        throw std::runtime_error(std::format("Failed to bind HTTP server on {}:{}", host_, port));
    }
    {
        std::lock_guard lock(server_mutex_);
        bound_port_ = port;
    }

    utils::log::info(std::format("Starting urlscope server on {}:{} ({} threads)",
        host_, port, thread_pool_size_));

    if (!svr->listen_after_bind()) {
        throw std::runtime_error("Failed to start HTTP server");
    }
}

void HttpServer::stop() {
    std::lock_guard lock(server_mutex_);
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

bool HttpServer::is_running() const {
    std::lock_guard lock(server_mutex_);
    return server_ && server_->is_running();
}

int HttpServer::bound_port() const {
    std::lock_guard lock(server_mutex_);
    return bound_port_;
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Post(http::kScreenshotRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_screenshot(req, res);
    });
    svr.Get(http::kHealthRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_screenshot(const httplib::Request& req, httplib::Response& res) {
    if (shutdown_coordinator_ && !shutdown_coordinator_->try_enter_request()) {
        send_error(res, httplib::StatusCode::ServiceUnavailable_503, "Server shutting down");
        return;
    }
    ShutdownGuard shutdown_guard{shutdown_coordinator_.get()};

    try {
        std::string url;
        try {
            const auto body = JsonValue::parse(req.body);
            const auto field = body["url"];
            if (!body.is_object() || !field.is_string()) {
                send_error(res, httplib::StatusCode::BadRequest_400, "Missing required field: url");
                return;
            }
            url = field.get<std::string>();
        } catch (const JsonValue::parse_error&) {
            send_error(res, httplib::StatusCode::BadRequest_400, "Invalid JSON body");
            return;
        }

        utils::log::info(std::format("Screenshot request for {}", url));
        const auto result = pipeline_->process(url);

        int status = status_for(result);
        if (result.error_category == ErrorCategory::POOL_REJECTED && pipeline_->health().draining) {
            status = httplib::StatusCode::ServiceUnavailable_503;
        }
        if (status == httplib::StatusCode::TooManyRequests_429) {
            res.set_header("Retry-After", "1");
        }
        res.status = status;
        res.set_content(to_json(result), http::kJsonContentType);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Screenshot handler failed: {}", e.what()));
        send_error(res, httplib::StatusCode::InternalServerError_500, "Internal error in request handling");
    }
}

void HttpServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    const auto health = pipeline_->health();
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);

    utils::log::debug(std::format("Health check: leased={}/{}, waiting={}",
        health.leased_count, health.capacity, health.waiting_count));

    res.status = health.draining ? httplib::StatusCode::ServiceUnavailable_503
                                 : httplib::StatusCode::OK_200;
    res.set_content(health_json(health, uptime), http::kJsonContentType);
}

// ============================================================================
// Response mapping
// ============================================================================

int HttpServer::status_for(const ScreenshotRequestResult& result) {
    if (result.is_success()) return httplib::StatusCode::OK_200;

    switch (result.error_category) {
        case ErrorCategory::MALFORMED_INPUT:
            return httplib::StatusCode::BadRequest_400;
        case ErrorCategory::POOL_REJECTED:
            return httplib::StatusCode::TooManyRequests_429;
        case ErrorCategory::POOL_TIMEOUT:
        case ErrorCategory::SESSION_CREATE_FAILED:
            return httplib::StatusCode::ServiceUnavailable_503;
        case ErrorCategory::CAPTURE_FAILED:
        case ErrorCategory::NETWORK_ERROR:
        case ErrorCategory::NONE:
            return httplib::StatusCode::OK_200;
        case ErrorCategory::INTERNAL_ERROR:
            break;
    }
    return httplib::StatusCode::InternalServerError_500;
}

std::string HttpServer::to_json(const ScreenshotRequestResult& result) {
    std::string out = std::format(R"({{"status":{})", json_string(result.status));
    if (result.message) {
        out += std::format(R"(,"message":{})", json_string(*result.message));
    }
    if (!result.is_success()) {
        out += std::format(R"(,"error_category":"{}")", error_category_to_string(result.error_category));
    }

    out += std::format(R"(,"original_url":{},"anonymized_url":{},"decoded_url":{},"stripped_url":{},"final_url":{})",
        json_string(result.original_url), json_string(result.anonymized_url),
        json_string(result.decoded_url), json_string(result.stripped_url),
        json_string(result.final_url));

    out += R"(,"identifiers":[)";
    for (size_t i = 0; i < result.identifiers.size(); ++i) {
        if (i > 0) out += ',';
        out += identifier_json(result.identifiers[i]);
    }
    out += ']';

    out += std::format(R"(,"referenced_urls":{},"unique_domains":{},"redirect_chain":{})",
        json_string_array(result.referenced_urls),
        json_string_array(result.unique_domains),
        json_string_array(result.redirect_chain));
    if (result.redirect_reason) {
        out += std::format(R"(,"redirect_reason":"{}")", termination_reason_to_string(*result.redirect_reason));
    }

    out += std::format(R"(,"original_ssl_info":{},"final_ssl_info":{},"original_whois_info":{},"final_whois_info":{})",
        certificate_json(result.original_certificate), certificate_json(result.final_certificate),
        whois_json(result.original_whois), whois_json(result.final_whois));

    out += std::format(R"(,"original_screenshot":{},"final_screenshot":{}}})",
        json_screenshot(result.original_screenshot),
        json_screenshot(result.final_screenshot));
    return out;
}

std::string HttpServer::health_json(const SessionPoolHealth& health, std::chrono::seconds uptime) {
    const char* status = "healthy";
    if (health.draining) {
        status = "unhealthy";
    } else if (health.capacity > 0 && health.leased_count >= health.capacity) {
        status = "degraded";
    }

    return std::format(
        R"({{"status":"{}","leased_count":{},"waiting_count":{},"capacity":{},)"
        R"("queue_capacity":{},"idle_count":{},"uptime_seconds":{}}})",
        status, health.leased_count, health.waiting_count, health.capacity,
        health.queue_capacity, health.idle_count, uptime.count());
}

} // namespace urlscope
