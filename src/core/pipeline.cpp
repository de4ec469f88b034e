#include "core/pipeline.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace urlscope {

Pipeline::Pipeline(PipelineComponents components, PipelineConfig config)
    : c_(std::move(components)),
      config_(std::move(config)) {

    if (!c_.codec || !c_.anonymizer || !c_.crawler || !c_.pool) {
        throw std::invalid_argument("Pipeline requires codec, anonymizer, crawler and session pool");
    }
    if (config_.capture_attempts == 0) {
        config_.capture_attempts = 1;
    }
}

ScreenshotRequestResult Pipeline::process(const std::string& raw_url) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
    utils::Timer timer;

    ScreenshotRequestResult result;
    result.original_url = raw_url;

    // Stage 1: Validate
    if (!validate(raw_url, result)) {
        requests_failed_.fetch_add(1, std::memory_order_relaxed);
        return result;
    }
    const auto url = Url::parse(raw_url);

    // Stage 2: Scan + anonymize
    if (!analyze(*url, result)) {
        return fail(std::move(result), ErrorCategory::INTERNAL_ERROR, "URL analysis failed");
    }

    // Stage 3: Redirect chain
    crawl(result);

    // Stage 4: Certificate + WHOIS
    inspect_domains(result);

    // Stage 5: Lease a browser session
    auto acquired = c_.pool->acquire(config_.request_timeout);
    if (acquired.is_error()) {
        utils::log::warn(std::format("Pipeline: no browser session for {}: {}",
            raw_url, acquired.error_message()));
        return fail(std::move(result), acquired.error_category(), acquired.error_message());
    }
    LeasedSession lease = std::move(acquired.value());

    // Stage 6: Capture original, then final
    std::vector<std::string> errors;
    ErrorCategory category = ErrorCategory::NONE;

    auto original = capture(lease, result.original_url, "original");
    if (original.is_ok()) {
        result.original_screenshot = std::move(original.value());
    } else {
        errors.push_back(std::format("Failed to capture screenshot of original URL: {}",
            original.error_message()));
        category = original.error_category();
    }

    auto final_shot = capture(lease, result.final_url, "final");
    if (final_shot.is_ok()) {
        result.final_screenshot = std::move(final_shot.value());
    } else {
        errors.push_back(std::format("Failed to capture screenshot of final URL: {}",
            final_shot.error_message()));
        if (category == ErrorCategory::NONE) category = final_shot.error_category();
    }

    // Stage 7: Release
    try {
        lease.release();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Pipeline: session release failed: {}", e.what()));
    }

    persist(result);

    if (!errors.empty()) {
        std::string message = errors.front();
        for (size_t i = 1; i < errors.size(); ++i) {
            message += "; ";
            message += errors[i];
        }
        return fail(std::move(result), category, std::move(message));
    }

    result.status = "success";
    utils::log::info(std::format("Processed {} ({} identifiers, {} hops) in {}ms",
        raw_url, result.identifiers.size(),
        result.redirect_chain.empty() ? 0 : result.redirect_chain.size() - 1, timer.elapsed_ms()));
    return result;
}

SessionPoolHealth Pipeline::health() const {
    return c_.pool->health();
}

// ============================================================================
// Stages
// ============================================================================

bool Pipeline::validate(const std::string& raw_url, ScreenshotRequestResult& result) const {
    auto reject = [&result](std::string message) {
        result.status = "error";
        result.error_category = ErrorCategory::MALFORMED_INPUT;
        result.message = std::move(message);
        utils::log::debug(std::format("Pipeline: rejected input: {}", *result.message));
        return false;
    };

    if (raw_url.empty()) {
        return reject("Invalid URL: empty");
    }
    if (raw_url.size() > config_.max_url_length) {
        return reject(std::format("Invalid URL: longer than {} characters", config_.max_url_length));
    }
    const auto url = Url::parse(raw_url);
    if (!url) {
        return reject("Invalid URL: could not be parsed");
    }
    const auto scheme = url->scheme_lower();
    if (scheme != "http" && scheme != "https") {
        return reject(std::format("Invalid URL: unsupported scheme '{}'", url->scheme()));
    }
    if (url->host().empty()) {
        return reject("Invalid URL: missing host");
    }
    return true;
}

bool Pipeline::analyze(const Url& url, ScreenshotRequestResult& result) const {
    try {
        auto identifiers = c_.codec->scan(url);
        auto anonymized = c_.anonymizer->apply(url, std::move(identifiers));

        result.anonymized_url = std::move(anonymized.anonymized_url);
        result.decoded_url = std::move(anonymized.decoded_url);
        result.stripped_url = std::move(anonymized.stripped_url);
        result.identifiers = std::move(anonymized.identifiers);
        result.referenced_urls = std::move(anonymized.referenced_urls);
        result.unique_domains = std::move(anonymized.unique_domains);
        return true;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Pipeline: analysis of {} failed: {}", result.original_url, e.what()));
        return false;
    }
}

void Pipeline::crawl(ScreenshotRequestResult& result) const {
    try {
        auto chain = c_.crawler->follow(result.original_url);
        if (chain.terminated_reason != TerminationReason::RESOLVED_NON_REDIRECT) {
            utils::log::warn(std::format("Redirect chain for {} ended with {} after {} hops{}",
                result.original_url, termination_reason_to_string(chain.terminated_reason),
                chain.hop_count(), chain.detail.empty() ? "" : ": " + chain.detail));
        }
        result.final_url = std::move(chain.final_url);
        result.redirect_chain = std::move(chain.steps);
        result.redirect_reason = chain.terminated_reason;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Pipeline: redirect crawl of {} failed: {}",
            result.original_url, e.what()));
        result.final_url = result.original_url;
        result.redirect_chain = {result.original_url};
        result.redirect_reason = TerminationReason::NETWORK_ERROR;
    }
    if (result.final_url.empty()) {
        result.final_url = result.original_url;
    }
}

void Pipeline::inspect_domains(ScreenshotRequestResult& result) const {
    if (!c_.certificates && !c_.whois) return;

    const auto original = Url::parse(result.original_url);
    const auto final_url = Url::parse(result.final_url);
    if (!original) return;

    if (c_.certificates) {
        const std::string original_host = original->hostname();
        result.original_certificate = inspect_certificate(original_host);
        if (final_url && final_url->hostname() != original_host) {
            result.final_certificate = inspect_certificate(final_url->hostname());
        } else {
            result.final_certificate = result.original_certificate;
        }
    }

    if (c_.whois) {
        const std::string original_domain = original->domain();
        result.original_whois = lookup_whois(original_domain);
        if (final_url && final_url->domain() != original_domain) {
            result.final_whois = lookup_whois(final_url->domain());
        } else {
            result.final_whois = result.original_whois;
        }
    }
}

std::optional<CertificateInfo> Pipeline::inspect_certificate(const std::string& host) const {
    try {
        auto cert = c_.certificates->inspect(host, config_.inspection_timeout);
        if (cert.is_ok()) return std::move(cert.value());
        utils::log::warn(std::format("Certificate lookup for {} failed: {}", host, cert.error_message()));
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Certificate lookup for {} failed: {}", host, e.what()));
    }
    inspections_failed_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

std::optional<WhoisInfo> Pipeline::lookup_whois(const std::string& domain) const {
    try {
        auto info = c_.whois->lookup(domain, config_.inspection_timeout);
        if (info.is_ok()) return std::move(info.value());
        utils::log::warn(std::format("WHOIS lookup for {} failed: {}", domain, info.error_message()));
    } catch (const std::exception& e) {
        utils::log::warn(std::format("WHOIS lookup for {} failed: {}", domain, e.what()));
    }
    inspections_failed_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

Result<std::vector<uint8_t>> Pipeline::capture(LeasedSession& lease,
                                               const std::string& url,
                                               const char* stage) {
    using R = Result<std::vector<uint8_t>>;
    R last = R::error(ErrorCategory::CAPTURE_FAILED, "no capture attempted");

    for (size_t attempt = 1; attempt <= config_.capture_attempts; ++attempt) {
        try {
            last = lease->capture_screenshot(url, config_.viewport);
        } catch (const std::exception& e) {
            last = R::error(ErrorCategory::CAPTURE_FAILED, e.what());
        }
        if (last.is_ok()) {
            return last;
        }

        utils::log::warn(std::format("Capture of {} URL {} failed (attempt {}/{}): {}",
            stage, url, attempt, config_.capture_attempts, last.error_message()));
        if (attempt < config_.capture_attempts && config_.capture_retry_delay.count() > 0) {
            std::this_thread::sleep_for(config_.capture_retry_delay);
        }
    }

    captures_failed_.fetch_add(1, std::memory_order_relaxed);
    lease.mark_broken();
    if (last.error_category() != ErrorCategory::CAPTURE_FAILED) {
        return R::error(ErrorCategory::CAPTURE_FAILED, last.error_message());
    }
    return last;
}

void Pipeline::persist(const ScreenshotRequestResult& result) const {
    if (config_.screenshot_dir.empty()) return;

    const auto stamp = utils::compact_timestamp(utils::now());
    const auto base = utils::url_to_snake_case(result.original_url);

    auto write = [&](const std::optional<std::vector<uint8_t>>& png, const char* stage) {
        if (!png) return;
        const auto path = std::filesystem::path(config_.screenshot_dir) /
            std::format("{}_{}_{}.png", base, stage, stamp);
        try {
            std::filesystem::create_directories(config_.screenshot_dir);
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("cannot open file for writing");
            }
            out.write(reinterpret_cast<const char*>(png->data()),
                      static_cast<std::streamsize>(png->size()));
            utils::log::debug(std::format("Saved {} screenshot to {}", stage, path.string()));
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Failed to save {} screenshot to {}: {}",
                stage, path.string(), e.what()));
        }
    };

    write(result.original_screenshot, "original");
    write(result.final_screenshot, "final");
}

ScreenshotRequestResult Pipeline::fail(ScreenshotRequestResult result, ErrorCategory category,
                                       std::string message) {
    requests_failed_.fetch_add(1, std::memory_order_relaxed);
    utils::log::error(std::format("Screenshot request for {} failed [{}]: {}",
        result.original_url, error_category_to_string(category), message));
    result.status = "error";
    result.error_category = category;
    result.message = std::move(message);
    return result;
}

} // namespace urlscope
