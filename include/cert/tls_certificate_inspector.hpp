#pragma once

#include "cert/icertificate_inspector.hpp"

#include <openssl/x509.h>

#include <atomic>
#include <cstdint>

namespace urlscope {

/**
 * @brief ICertificateInspector over an OpenSSL client handshake
 *
 * Verification is disabled: expired, self-signed and mismatched certificates
 * are reported, not rejected. SNI is sent for hostnames, not for IP literals.
 */
class TlsCertificateInspector : public ICertificateInspector {
public:
    struct Config {
        uint16_t port = 443;
        uint32_t warning_days = 30;     // EXPIRING_SOON below this many days
    };

    TlsCertificateInspector();
    explicit TlsCertificateInspector(Config config);

    [[nodiscard]] Result<CertificateInfo> inspect(const std::string& host,
                                                  std::chrono::milliseconds timeout) override;

    /**
     * @brief Read names, validity, version and serial out of a certificate
     * @param now Reference time for days_remaining and status
     */
    [[nodiscard]] static Result<CertificateInfo> describe(X509* cert,
                                                          std::chrono::system_clock::time_point now,
                                                          uint32_t warning_days = 30);

    struct Stats {
        uint64_t inspections;
        uint64_t failures;
    };
    [[nodiscard]] Stats get_stats() const {
        return {
            .inspections = inspections_.load(std::memory_order_relaxed),
            .failures = failures_.load(std::memory_order_relaxed),
        };
    }

private:
    Config config_;
    std::atomic<uint64_t> inspections_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace urlscope
