#pragma once

#include "browser/session_pool.hpp"
#include "cert/icertificate_inspector.hpp"
#include "codec/anonymizer.hpp"
#include "codec/identifier_codec.hpp"
#include "core/types.hpp"
#include "crawler/redirect_crawler.hpp"
#include "whois/iwhois_client.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace urlscope {

struct PipelineComponents {
    std::shared_ptr<IdentifierCodec> codec;
    std::shared_ptr<Anonymizer> anonymizer;
    std::shared_ptr<RedirectCrawler> crawler;
    std::shared_ptr<SessionPool> pool;
    std::shared_ptr<ICertificateInspector> certificates;   // optional; null = no TLS lookups
    std::shared_ptr<IWhoisClient> whois;                   // optional; null = no WHOIS lookups
};

struct PipelineConfig {
    std::chrono::milliseconds request_timeout{60000};   // bound on pool acquire
    size_t max_url_length = 2048;
    size_t capture_attempts = 3;
    std::chrono::milliseconds capture_retry_delay{1000};
    std::chrono::milliseconds inspection_timeout{5000}; // per certificate / WHOIS lookup
    Viewport viewport;
    std::string screenshot_dir;                         // empty = keep in memory only
};

/**
 * @brief Request coordinator for one submitted URL
 *
 * Stages:
 * 1. Validate (length, parse, http/https, host)
 * 2. Scan + anonymize
 * 3. Follow redirects from the original URL
 * 4. Certificate + WHOIS lookups for the original and final hosts
 * 5. Lease a browser session (bounded by request_timeout)
 * 6. Capture original URL, then final URL
 * 7. Release the lease
 *
 * process() never throws; every failure ends up in status/message.
 */
class Pipeline {
public:
    explicit Pipeline(PipelineComponents components, PipelineConfig config = {});

    [[nodiscard]] ScreenshotRequestResult process(const std::string& raw_url);

    [[nodiscard]] SessionPoolHealth health() const;

    std::shared_ptr<SessionPool> get_session_pool() const { return c_.pool; }
    [[nodiscard]] const PipelineConfig& config() const { return config_; }

    struct Stats {
        uint64_t total_requests;
        uint64_t requests_failed;
        uint64_t captures_failed;
        uint64_t inspections_failed;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .requests_failed = requests_failed_.load(std::memory_order_relaxed),
            .captures_failed = captures_failed_.load(std::memory_order_relaxed),
            .inspections_failed = inspections_failed_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] bool validate(const std::string& raw_url, ScreenshotRequestResult& result) const;
    [[nodiscard]] bool analyze(const Url& url, ScreenshotRequestResult& result) const;
    void crawl(ScreenshotRequestResult& result) const;

    /** @brief Lookup failures only log; the affected fields stay empty */
    void inspect_domains(ScreenshotRequestResult& result) const;
    [[nodiscard]] std::optional<CertificateInfo> inspect_certificate(const std::string& host) const;
    [[nodiscard]] std::optional<WhoisInfo> lookup_whois(const std::string& domain) const;

    /**
     * @brief Capture with retries on the same lease
     * @return Screenshot bytes, or the last error
     */
    [[nodiscard]] Result<std::vector<uint8_t>> capture(LeasedSession& lease,
                                                       const std::string& url,
                                                       const char* stage);

    void persist(const ScreenshotRequestResult& result) const;

    ScreenshotRequestResult fail(ScreenshotRequestResult result, ErrorCategory category,
                                 std::string message);

    PipelineComponents c_;
    PipelineConfig config_;

    mutable std::atomic<uint64_t> total_requests_{0};
    mutable std::atomic<uint64_t> requests_failed_{0};
    mutable std::atomic<uint64_t> captures_failed_{0};
    mutable std::atomic<uint64_t> inspections_failed_{0};
};

} // namespace urlscope
