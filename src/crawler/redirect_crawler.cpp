#include "crawler/redirect_crawler.hpp"
#include "core/url.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <thread>

namespace urlscope {

RedirectCrawler::RedirectCrawler(std::shared_ptr<IRedirectProbe> probe, CrawlerConfig config)
    : probe_(std::move(probe)), config_(std::move(config)) {
    if (!probe_) {
        throw std::invalid_argument("RedirectCrawler requires a probe");
    }
}

RedirectChain RedirectCrawler::follow(const std::string& url) const {
    return follow(url, config_.max_hops, config_.per_hop_timeout);
}

bool RedirectCrawler::is_allowed_target(const std::string& url, std::string& reason) const {
    const auto parsed = Url::parse(url);
    if (!parsed) {
        reason = std::format("unparseable redirect target '{}'", url);
        return false;
    }

    const std::string scheme = parsed->scheme_lower();
    if (std::find(config_.allowed_schemes.begin(), config_.allowed_schemes.end(), scheme)
            == config_.allowed_schemes.end()) {
        reason = std::format("scheme '{}' not allowed", scheme);
        return false;
    }

    if (config_.allowed_domains.empty()) return true;

    const std::string host = parsed->domain();
    for (const auto& allowed : config_.allowed_domains) {
        const std::string domain = utils::to_lower(allowed);
        if (host == domain || utils::ends_with_ci(host, "." + domain)) {
            return true;
        }
    }
    reason = std::format("domain '{}' not allowed", host);
    return false;
}

RedirectChain RedirectCrawler::follow(const std::string& url,
                                      size_t max_hops,
                                      std::chrono::milliseconds per_hop_timeout) const {
    RedirectChain chain;
    chain.steps.push_back(url);

    size_t redirects_followed = 0;
    while (true) {
        const std::string& current = chain.steps.back();
        const ProbeResponse response = probe_->probe(current, per_hop_timeout);

        if (response.outcome == ProbeResponse::Outcome::TIMEOUT) {
            chain.terminated_reason = TerminationReason::TIMEOUT;
            chain.detail = response.error;
            break;
        }
        if (response.outcome == ProbeResponse::Outcome::NETWORK_ERROR) {
            chain.terminated_reason = TerminationReason::NETWORK_ERROR;
            chain.detail = response.error;
            break;
        }

        chain.last_status = response.status;
        if (!response.is_redirect() || !response.location) {
            chain.terminated_reason = TerminationReason::RESOLVED_NON_REDIRECT;
            break;
        }

        const auto base = Url::parse(current);
        const auto next = base ? resolve_reference(*base, *response.location) : std::nullopt;
        std::string reason;
        if (!next) {
            chain.terminated_reason = TerminationReason::REDIRECT_BLOCKED;
            chain.detail = std::format("unresolvable Location '{}'", *response.location);
            break;
        }
        if (!is_allowed_target(*next, reason)) {
            chain.terminated_reason = TerminationReason::REDIRECT_BLOCKED;
            chain.detail = std::move(reason);
            break;
        }

        if (std::find(chain.steps.begin(), chain.steps.end(), *next) != chain.steps.end()) {
            chain.terminated_reason = TerminationReason::MAX_HOPS_EXCEEDED;
            chain.detail = std::format("redirect loop back to {}", *next);
            break;
        }
        if (redirects_followed >= max_hops) {
            chain.terminated_reason = TerminationReason::MAX_HOPS_EXCEEDED;
            chain.detail = std::format("more than {} redirects", max_hops);
            break;
        }

        chain.steps.push_back(*next);
        ++redirects_followed;
        utils::log::debug(std::format("Redirect {} -> {} ({})",
            chain.steps[chain.steps.size() - 2], chain.steps.back(), response.status));

        if (config_.hop_delay.count() > 0) {
            std::this_thread::sleep_for(config_.hop_delay);
        }
    }

    chain.final_url = chain.steps.back();
    return chain;
}

} // namespace urlscope
