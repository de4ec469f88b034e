#include <catch2/catch_test_macros.hpp>
#include "whois/tcp_whois_client.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace urlscope;

namespace {

/**
 * @brief Loopback WHOIS server answering successive connections from a script
 *
 * Records every query line; connections past the end of the script are
 * closed without an answer.
 */
class ScriptedWhoisServer {
public:
    explicit ScriptedWhoisServer(std::vector<std::string> answers)
        : answers_(std::move(answers)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd_ >= 0);
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(fd_, 8) == 0);

        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~ScriptedWhoisServer() {
        ::shutdown(fd_, SHUT_RDWR);
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    [[nodiscard]] uint16_t port() const { return port_; }

    [[nodiscard]] std::vector<std::string> queries() const {
        std::lock_guard lock(mutex_);
        return queries_;
    }

private:
    void serve() {
        for (const auto& answer : answers_) {
            const int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) return;

            std::string query;
            char buf[256];
            while (query.find("\r\n") == std::string::npos) {
                const ssize_t n = ::recv(client, buf, sizeof(buf), 0);
                if (n <= 0) break;
                query.append(buf, static_cast<size_t>(n));
            }
            {
                std::lock_guard lock(mutex_);
                queries_.push_back(query);
            }
            ::send(client, answer.data(), answer.size(), MSG_NOSIGNAL);
            ::close(client);
        }
    }

    std::vector<std::string> answers_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<std::string> queries_;
};

constexpr const char* kRootAnswer =
    "% IANA WHOIS server\r\n"
    "\r\n"
    "refer:        127.0.0.1\r\n"
    "\r\n"
    "domain:       COM\r\n"
    "organisation: Root Registry Operator\r\n"
    "created:      1985-01-01\r\n";

constexpr const char* kRegistryAnswer =
    "   Domain Name: EXAMPLE.COM\r\n"
    "   Registrar WHOIS Server: whois://localhost/\r\n"
    "   Registrar: Example Registrar, Inc.\r\n"
    "   Creation Date: 1995-08-14T04:00:00Z\r\n"
    "   Registry Expiry Date: 2030-08-13T04:00:00Z\r\n";

constexpr const char* kRegistrarAnswer =
    "Domain Name: example.com\r\n"
    "Updated Date: 2024-08-14T07:01:34Z\r\n"
    "Registrant Organization: Example Org\r\n"
    ">>> Last update of WHOIS database: 2026-10-18T00:00:00Z <<<\r\n";

} // namespace

TEST_CASE("TcpWhoisClient: parse_response matches keys case-insensitively", "[whois]") {
    const auto info = TcpWhoisClient::parse_response("example.com", "whois.test",
        "% comment: ignored\n"
        "OrgName:   First Org\n"
        "Organization: Second Org\n"
        "Creation Date: 2001-02-03\n"
        "changed: 2020-01-01\n"
        "Expiry Date:\n"
        "expires: 2030-01-01\n");

    CHECK(info.domain == "example.com");
    CHECK(info.server == "whois.test");
    CHECK(info.organisation == "First Org");
    CHECK(info.created == "2001-02-03");
    CHECK(info.changed == "2020-01-01");
    CHECK(info.expires == "2030-01-01");
    CHECK_FALSE(info.registrar.has_value());
}

TEST_CASE("TcpWhoisClient: referral forms", "[whois]") {
    CHECK(TcpWhoisClient::referral(kRootAnswer) == "127.0.0.1");
    CHECK(TcpWhoisClient::referral(kRegistryAnswer) == "localhost");
    CHECK(TcpWhoisClient::referral("whois:        WHOIS.NIC.IO\n") == "whois.nic.io");
    CHECK_FALSE(TcpWhoisClient::referral(kRegistrarAnswer).has_value());
    CHECK_FALSE(TcpWhoisClient::referral("").has_value());
}

TEST_CASE("TcpWhoisClient: follows referrals and prefers the most specific answer", "[whois][integration]") {
    ScriptedWhoisServer server({kRootAnswer, kRegistryAnswer, kRegistrarAnswer});
    TcpWhoisClient client({.server = "localhost", .port = server.port()});

    const auto result = client.lookup("example.com", std::chrono::milliseconds(2000));
    REQUIRE(result.is_ok());
    const auto& info = result.value();
    CHECK(info.domain == "example.com");
    CHECK(info.server == "localhost");
    CHECK(info.organisation == "Example Org");
    CHECK(info.changed == "2024-08-14T07:01:34Z");
    CHECK(info.registrar == "Example Registrar, Inc.");
    CHECK(info.created == "1995-08-14T04:00:00Z");
    CHECK(info.expires == "2030-08-13T04:00:00Z");

    CHECK(server.queries() == std::vector<std::string>(3, "example.com\r\n"));
    const auto stats = client.get_stats();
    CHECK(stats.lookups == 1);
    CHECK(stats.referrals_followed == 2);
    CHECK(stats.failures == 0);
}

TEST_CASE("TcpWhoisClient: root answer stands when referrals are off", "[whois][integration]") {
    ScriptedWhoisServer server({kRootAnswer});
    TcpWhoisClient client({.server = "127.0.0.1", .port = server.port(), .follow_referrals = false});

    const auto result = client.lookup("example.com", std::chrono::milliseconds(2000));
    REQUIRE(result.is_ok());
    CHECK(result.value().server == "127.0.0.1");
    CHECK(result.value().organisation == "Root Registry Operator");
    CHECK(result.value().created == "1985-01-01");
    CHECK(server.queries().size() == 1);
}

TEST_CASE("TcpWhoisClient: failed referral keeps the answer so far", "[whois][integration]") {
    ScriptedWhoisServer server({"refer: whois.nonexistent.invalid\r\nchanged: 2019-05-05\r\n"});
    TcpWhoisClient client({.server = "127.0.0.1", .port = server.port()});

    const auto result = client.lookup("example.com", std::chrono::milliseconds(1000));
    REQUIRE(result.is_ok());
    CHECK(result.value().server == "127.0.0.1");
    CHECK(result.value().changed == "2019-05-05");
    CHECK(client.get_stats().referrals_followed == 0);
}

TEST_CASE("TcpWhoisClient: unreachable root server is an error", "[whois][integration]") {
    TcpWhoisClient client({.server = "127.0.0.1", .port = 1});

    const auto result = client.lookup("example.com", std::chrono::milliseconds(500));
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::NETWORK_ERROR);
    CHECK(result.error_message().find("example.com") != std::string::npos);
    CHECK(client.get_stats().failures == 1);
}
