#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace urlscope {

/**
 * @brief Owned, connected TCP socket with per-operation timeouts
 *
 * connect() bounds the TCP handshake by `timeout`; the same value is then
 * applied as SO_RCVTIMEO / SO_SNDTIMEO, so every blocking read or write on
 * the descriptor (including one made by OpenSSL) gives up after it.
 */
class TcpConnection {
public:
    /**
     * @brief Resolve host and connect to the first reachable address
     * @return Connection, or NETWORK_ERROR (resolution, refusal, timeout)
     */
    [[nodiscard]] static Result<TcpConnection> connect(const std::string& host,
                                                       uint16_t port,
                                                       std::chrono::milliseconds timeout);

    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    TcpConnection(TcpConnection&& other) noexcept;
    TcpConnection& operator=(TcpConnection&& other) noexcept;

    [[nodiscard]] int fd() const { return fd_; }

    /** @brief Send every byte; false on error or timeout */
    [[nodiscard]] bool write_all(std::string_view data);

    /**
     * @brief Read until the peer closes
     * @return Everything received (at most max_bytes), or NETWORK_ERROR
     */
    [[nodiscard]] Result<std::string> read_all(size_t max_bytes);

private:
    explicit TcpConnection(int fd) : fd_(fd) {}

    int fd_ = -1;
};

} // namespace urlscope
