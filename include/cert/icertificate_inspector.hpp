#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <string>

namespace urlscope {

/**
 * @brief Fetches the certificate a host presents on its TLS port
 */
class ICertificateInspector {
public:
    virtual ~ICertificateInspector() = default;

    /**
     * @param host Hostname or IP literal (no brackets)
     * @param timeout Budget for connect, and for each read/write of the handshake
     * @return Certificate, or NETWORK_ERROR when no certificate could be obtained
     */
    [[nodiscard]] virtual Result<CertificateInfo> inspect(const std::string& host,
                                                          std::chrono::milliseconds timeout) = 0;
};

} // namespace urlscope
