#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace urlscope {

/**
 * @brief One live remote browser session
 *
 * Not thread-safe: a session is used by exactly one leaseholder at a time.
 */
class IBrowserSession {
public:
    virtual ~IBrowserSession() = default;

    /**
     * @brief Navigate to url, wait for the page, return PNG bytes
     * @return PNG bytes, or CAPTURE_FAILED / NETWORK_ERROR
     */
    [[nodiscard]] virtual Result<std::vector<uint8_t>> capture_screenshot(
        const std::string& url, const Viewport& viewport) = 0;

    /**
     * @brief False once the remote side is known to be gone
     */
    [[nodiscard]] virtual bool is_alive() const = 0;

    /**
     * @brief Terminate the remote session (idempotent)
     */
    virtual void close() = 0;

    [[nodiscard]] virtual const std::string& id() const = 0;
};

} // namespace urlscope
