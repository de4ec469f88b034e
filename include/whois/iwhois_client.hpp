#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <string>

namespace urlscope {

/**
 * @brief Looks up registration data for a registrable domain
 */
class IWhoisClient {
public:
    virtual ~IWhoisClient() = default;

    /**
     * @param domain Domain without "www." (e.g. "example.com")
     * @param timeout Budget for each server contacted
     */
    [[nodiscard]] virtual Result<WhoisInfo> lookup(const std::string& domain,
                                                   std::chrono::milliseconds timeout) = 0;
};

} // namespace urlscope
