#pragma once

#include "whois/iwhois_client.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string_view>

namespace urlscope {

/**
 * @brief RFC 3912 WHOIS client with referral following
 *
 * Queries the configured root server (IANA by default), then follows
 * "refer:" / "whois:" / "Registrar WHOIS Server:" lines to the registry and
 * registrar. Fields are taken from the most specific answer first; the root
 * answer (which describes the TLD) only counts when no referral answered.
 * A referral that fails ends the chain with a warning and keeps what was
 * already collected.
 */
class TcpWhoisClient : public IWhoisClient {
public:
    struct Config {
        std::string server = "whois.iana.org";
        uint16_t port = 43;
        bool follow_referrals = true;
    };

    static constexpr size_t kMaxReferrals = 2;
    static constexpr size_t kMaxResponseBytes = 1024 * 1024;

    TcpWhoisClient();
    explicit TcpWhoisClient(Config config);

    [[nodiscard]] Result<WhoisInfo> lookup(const std::string& domain,
                                           std::chrono::milliseconds timeout) override;

    /** @brief Extract known "key: value" fields; first occurrence wins */
    [[nodiscard]] static WhoisInfo parse_response(const std::string& domain,
                                                  const std::string& server,
                                                  std::string_view raw);

    /** @brief Next server named in a response, if any */
    [[nodiscard]] static std::optional<std::string> referral(std::string_view raw);

    struct Stats {
        uint64_t lookups;
        uint64_t failures;
        uint64_t referrals_followed;
    };
    [[nodiscard]] Stats get_stats() const {
        return {
            .lookups = lookups_.load(std::memory_order_relaxed),
            .failures = failures_.load(std::memory_order_relaxed),
            .referrals_followed = referrals_followed_.load(std::memory_order_relaxed),
        };
    }

private:
    Result<std::string> query(const std::string& server, const std::string& domain,
                              std::chrono::milliseconds timeout) const;

    Config config_;
    std::atomic<uint64_t> lookups_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> referrals_followed_{0};
};

} // namespace urlscope
