#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace urlscope {

// ============================================================================
// Identifiers
// ============================================================================

enum class IdentifierKind {
    EMAIL,
    PHONE,
    GENERIC,
    UNRECOGNIZED
};

[[nodiscard]] inline const char* identifier_kind_to_string(IdentifierKind kind) {
    switch (kind) {
        case IdentifierKind::EMAIL:        return "email";
        case IdentifierKind::PHONE:        return "phone";
        case IdentifierKind::GENERIC:      return "generic";
        case IdentifierKind::UNRECOGNIZED: return "unrecognized";
    }
    return "unknown";
}

/**
 * @brief Where in the URL an identifier was found
 */
struct IdentifierLocation {
    enum class Component { QUERY, PATH };

    Component component = Component::QUERY;
    size_t index = 0;           // query piece index or path segment index
    std::string key;            // percent-decoded query key (empty for PATH)

    bool operator==(const IdentifierLocation&) const = default;
};

/**
 * @brief A base64-encoded value discovered in a URL
 *
 * `raw` is the base64 text (after percent-decoding of its component), so
 * base64-decoding `raw` yields `decoded` whenever `decoded` is present.
 */
struct Identifier {
    std::string raw;
    std::optional<std::string> decoded;     // absent when the bytes are not text
    IdentifierKind kind = IdentifierKind::UNRECOGNIZED;
    std::string anonymized;                 // placeholder, filled by the Anonymizer
    IdentifierLocation location;
};

struct AnonymizationResult {
    std::string original_url;
    std::string anonymized_url;
    std::string decoded_url;                     // identifiers replaced by their decoded text
    std::string stripped_url;                    // anonymized_url without query and fragment
    std::vector<Identifier> identifiers;         // first-occurrence order
    std::vector<std::string> referenced_urls;    // http(s) URLs carried in query values
    std::vector<std::string> unique_domains;     // first-seen order, "www." stripped
};

// ============================================================================
// Redirect chain
// ============================================================================

enum class TerminationReason {
    RESOLVED_NON_REDIRECT,
    MAX_HOPS_EXCEEDED,
    TIMEOUT,
    NETWORK_ERROR,
    REDIRECT_BLOCKED
};

[[nodiscard]] inline const char* termination_reason_to_string(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::RESOLVED_NON_REDIRECT: return "resolved_non_redirect";
        case TerminationReason::MAX_HOPS_EXCEEDED:     return "max_hops_exceeded";
        case TerminationReason::TIMEOUT:               return "timeout";
        case TerminationReason::NETWORK_ERROR:         return "network_error";
        case TerminationReason::REDIRECT_BLOCKED:      return "redirect_blocked";
    }
    return "unknown";
}

struct RedirectChain {
    std::vector<std::string> steps;     // steps[0] is the starting URL
    std::string final_url;
    TerminationReason terminated_reason = TerminationReason::RESOLVED_NON_REDIRECT;
    int last_status = 0;                // status of the last response, 0 if none
    std::string detail;                 // probe error / block reason, if any

    [[nodiscard]] size_t hop_count() const { return steps.empty() ? 0 : steps.size() - 1; }
};

// ============================================================================
// Domain inspection
// ============================================================================

enum class CertificateStatus {
    VALID,
    EXPIRING_SOON,
    EXPIRED,
    NOT_YET_VALID
};

[[nodiscard]] inline const char* certificate_status_to_string(CertificateStatus status) {
    switch (status) {
        case CertificateStatus::VALID:         return "valid";
        case CertificateStatus::EXPIRING_SOON: return "expiring_soon";
        case CertificateStatus::EXPIRED:       return "expired";
        case CertificateStatus::NOT_YET_VALID: return "not_yet_valid";
    }
    return "unknown";
}

/**
 * @brief Leaf certificate a TLS server presented, as seen at inspection time
 */
struct CertificateInfo {
    std::string host;
    std::string issuer;                 // RFC 2253 distinguished name
    std::string subject;
    std::chrono::system_clock::time_point valid_from;
    std::chrono::system_clock::time_point valid_to;
    int64_t days_remaining = 0;         // negative once expired
    uint32_t version = 0;               // 3 for X.509v3
    std::string serial_number;          // uppercase hex
    CertificateStatus status = CertificateStatus::VALID;
};

struct WhoisInfo {
    std::string domain;
    std::string server;                 // server that gave the most specific answer
    std::optional<std::string> organisation;
    std::optional<std::string> registrar;
    std::optional<std::string> created;
    std::optional<std::string> changed;
    std::optional<std::string> expires;
};

// ============================================================================
// Request result
// ============================================================================

struct Viewport {
    uint32_t width = 1920;
    uint32_t height = 1080;
};

/**
 * @brief Everything one /screenshot request produced
 *
 * status is "success" or "error"; URLs and identifiers are filled whenever
 * input validation passed, regardless of later failures.
 */
struct ScreenshotRequestResult {
    std::string original_url;
    std::string anonymized_url;
    std::string decoded_url;
    std::string stripped_url;
    std::string final_url;
    std::vector<Identifier> identifiers;
    std::vector<std::string> referenced_urls;
    std::vector<std::string> unique_domains;

    std::vector<std::string> redirect_chain;
    std::optional<TerminationReason> redirect_reason;

    // Filled when the lookup is enabled and succeeded; failures only log
    std::optional<CertificateInfo> original_certificate;
    std::optional<CertificateInfo> final_certificate;
    std::optional<WhoisInfo> original_whois;
    std::optional<WhoisInfo> final_whois;

    std::optional<std::vector<uint8_t>> original_screenshot;
    std::optional<std::vector<uint8_t>> final_screenshot;

    std::string status = "success";
    std::optional<std::string> message;
    ErrorCategory error_category = ErrorCategory::NONE;

    [[nodiscard]] bool is_success() const { return status == "success"; }
};

} // namespace urlscope
