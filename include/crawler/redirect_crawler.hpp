#pragma once

#include "core/types.hpp"
#include "crawler/iredirect_probe.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace urlscope {

struct CrawlerConfig {
    size_t max_hops = 10;
    std::chrono::milliseconds per_hop_timeout{30000};
    std::chrono::milliseconds hop_delay{0};
    std::vector<std::string> allowed_schemes = {"http", "https"};
    std::vector<std::string> allowed_domains;   // suffix match; empty = any
};

/**
 * @brief Follows a URL's redirect chain one probe at a time
 *
 * Termination:
 * - non-3xx response, or 3xx without Location -> RESOLVED_NON_REDIRECT
 * - redirect to an already visited URL, or more than max_hops redirects
 *   -> MAX_HOPS_EXCEEDED
 * - probe timeout -> TIMEOUT, probe failure -> NETWORK_ERROR
 *   (final_url is the last visited URL in both cases)
 * - unresolvable Location or disallowed scheme/domain -> REDIRECT_BLOCKED
 *
 * steps never holds more than max_hops + 1 URLs.
 */
class RedirectCrawler {
public:
    RedirectCrawler(std::shared_ptr<IRedirectProbe> probe, CrawlerConfig config = {});

    [[nodiscard]] RedirectChain follow(const std::string& url) const;

    [[nodiscard]] RedirectChain follow(const std::string& url,
                                       size_t max_hops,
                                       std::chrono::milliseconds per_hop_timeout) const;

    [[nodiscard]] const CrawlerConfig& config() const { return config_; }

private:
    [[nodiscard]] bool is_allowed_target(const std::string& url, std::string& reason) const;

    std::shared_ptr<IRedirectProbe> probe_;
    CrawlerConfig config_;
};

} // namespace urlscope
