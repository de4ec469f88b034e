#include "net/tcp_connection.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <memory>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace urlscope {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* p) const { if (p) freeaddrinfo(p); }
};

// Non-blocking connect bounded by timeout; fd is left in blocking mode
bool connect_with_timeout(int fd, const addrinfo* ai, std::chrono::milliseconds timeout,
                          std::string& error) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        error = std::format("fcntl failed: {}", strerror(errno));
        return false;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            error = strerror(errno);
            return false;
        }
        pollfd pfd{fd, POLLOUT, 0};
        int ready;
        do {
            ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);
        if (ready == 0) {
            error = std::format("connect timed out after {}ms", timeout.count());
            return false;
        }
        if (ready < 0) {
            error = std::format("poll failed: {}", strerror(errno));
            return false;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            error = strerror(so_error != 0 ? so_error : errno);
            return false;
        }
    }

    if (fcntl(fd, F_SETFL, flags) < 0) {
        error = std::format("fcntl failed: {}", strerror(errno));
        return false;
    }

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    return true;
}

} // anonymous namespace

Result<TcpConnection> TcpConnection::connect(const std::string& host,
                                             uint16_t port,
                                             std::chrono::milliseconds timeout) {
    using R = Result<TcpConnection>;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    const std::string service = std::to_string(port);
    if (const int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &raw); rc != 0 || !raw) {
        return R::error(ErrorCategory::NETWORK_ERROR,
            std::format("DNS resolution failed for {}: {}", host, gai_strerror(rc)));
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> addresses(raw);

    std::string last_error = "no address";
    for (const addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = strerror(errno);
            continue;
        }
        if (connect_with_timeout(fd, ai, timeout, last_error)) {
            return R::ok(TcpConnection(fd));
        }
        ::close(fd);
    }

    return R::error(ErrorCategory::NETWORK_ERROR,
        std::format("connect to {}:{} failed: {}", host, port, last_error));
}

TcpConnection::~TcpConnection() {
    if (fd_ >= 0) ::close(fd_);
}

TcpConnection::TcpConnection(TcpConnection&& other) noexcept
    : fd_(other.fd_) {
    other.fd_ = -1;
}

TcpConnection& TcpConnection::operator=(TcpConnection&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

bool TcpConnection::write_all(std::string_view data) {
    while (!data.empty()) {
        const ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

Result<std::string> TcpConnection::read_all(size_t max_bytes) {
    std::string out;
    char buf[4096];
    while (out.size() < max_bytes) {
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            const bool timed_out = errno == EAGAIN || errno == EWOULDBLOCK;
            return Result<std::string>::error(ErrorCategory::NETWORK_ERROR,
                timed_out ? std::string("read timed out") : std::format("read failed: {}", strerror(errno)));
        }
        out.append(buf, static_cast<size_t>(std::min<size_t>(static_cast<size_t>(n), max_bytes - out.size())));
    }
    return Result<std::string>::ok(std::move(out));
}

} // namespace urlscope
