#include "crawler/http_redirect_probe.hpp"
#include "core/url.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace urlscope {

HttpRedirectProbe::HttpRedirectProbe() = default;

HttpRedirectProbe::HttpRedirectProbe(Config config)
    : config_(std::move(config)) {}

ProbeResponse HttpRedirectProbe::probe(const std::string& url, std::chrono::milliseconds timeout) {
    probes_.fetch_add(1, std::memory_order_relaxed);

    const auto parsed = Url::parse(url);
    if (!parsed) {
        network_errors_.fetch_add(1, std::memory_order_relaxed);
        return ProbeResponse::network_error(std::format("Invalid URL: {}", url));
    }
    const std::string scheme = parsed->scheme_lower();
    if (scheme != "http" && scheme != "https") {
        network_errors_.fetch_add(1, std::memory_order_relaxed);
        return ProbeResponse::network_error(std::format("Unsupported scheme: {}", scheme));
    }

    httplib::Client cli(parsed->origin());
    cli.set_follow_location(false);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);
    if (scheme == "https") {
        cli.enable_server_certificate_verification(config_.verify_tls);
    }

    const httplib::Headers headers = {
        {"User-Agent", config_.user_agent},
        {"Accept", "*/*"}
    };
    const std::string target = parsed->request_target();

    std::optional<ProbeResponse> captured;
    const utils::Timer timer;

    httplib::Result res = [&] {
        if (config_.method == "HEAD") {
            return cli.Head(target, headers);
        }
        // Capture status + Location from the headers, then cancel the body read
        return cli.Get(target, headers,
            [&captured](const httplib::Response& r) {
                std::optional<std::string> location;
                if (r.has_header("Location")) location = r.get_header_value("Location");
                captured = ProbeResponse::ok(r.status, std::move(location));
                return false;
            },
            [](const char*, size_t) { return true; });
    }();

    if (captured) {
        return *captured;
    }

    if (res) {
        std::optional<std::string> location;
        if (res->has_header("Location")) location = res->get_header_value("Location");
        return ProbeResponse::ok(res->status, std::move(location));
    }

    const auto err = res.error();
    const std::string message = std::format("{} ({})", httplib::to_string(err), url);
    if (err == httplib::Error::ConnectionTimeout || timer.elapsed_ms() >= timeout) {
        timeouts_.fetch_add(1, std::memory_order_relaxed);
        return ProbeResponse::timeout(message);
    }

    network_errors_.fetch_add(1, std::memory_order_relaxed);
    return ProbeResponse::network_error(message);
}

HttpRedirectProbe::Stats HttpRedirectProbe::get_stats() const {
    return {
        probes_.load(std::memory_order_relaxed),
        timeouts_.load(std::memory_order_relaxed),
        network_errors_.load(std::memory_order_relaxed)
    };
}

} // namespace urlscope
