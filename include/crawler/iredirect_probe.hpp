#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace urlscope {

/**
 * @brief Outcome of one non-following HTTP request
 */
struct ProbeResponse {
    enum class Outcome { OK, TIMEOUT, NETWORK_ERROR };

    Outcome outcome = Outcome::OK;
    int status = 0;
    std::optional<std::string> location;    // raw Location header, if present
    std::string error;

    static ProbeResponse ok(int status, std::optional<std::string> location = std::nullopt) {
        ProbeResponse r;
        r.status = status;
        r.location = std::move(location);
        return r;
    }

    static ProbeResponse timeout(std::string message) {
        ProbeResponse r;
        r.outcome = Outcome::TIMEOUT;
        r.error = std::move(message);
        return r;
    }

    static ProbeResponse network_error(std::string message) {
        ProbeResponse r;
        r.outcome = Outcome::NETWORK_ERROR;
        r.error = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_redirect() const { return outcome == Outcome::OK && status >= 300 && status < 400; }
};

/**
 * @brief Issues a single request without following redirects
 */
class IRedirectProbe {
public:
    virtual ~IRedirectProbe() = default;

    /**
     * @param url Absolute http(s) URL
     * @param timeout Budget for connect + response headers
     */
    [[nodiscard]] virtual ProbeResponse probe(const std::string& url,
                                              std::chrono::milliseconds timeout) = 0;
};

} // namespace urlscope
