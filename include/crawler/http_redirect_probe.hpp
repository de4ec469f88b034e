#pragma once

#include "crawler/iredirect_probe.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace urlscope {

/**
 * @brief IRedirectProbe over cpp-httplib (OpenSSL for https)
 *
 * A GET probe stops reading as soon as the status line and headers arrive;
 * the response body is never downloaded.
 */
class HttpRedirectProbe : public IRedirectProbe {
public:
    struct Config {
        std::string method = "GET";         // "GET" or "HEAD"
        std::string user_agent = "urlscope/1.0";
        bool verify_tls = true;
    };

    HttpRedirectProbe();
    explicit HttpRedirectProbe(Config config);

    [[nodiscard]] ProbeResponse probe(const std::string& url,
                                      std::chrono::milliseconds timeout) override;

    struct Stats {
        uint64_t probes;
        uint64_t timeouts;
        uint64_t network_errors;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    Config config_;
    std::atomic<uint64_t> probes_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> network_errors_{0};
};

} // namespace urlscope
