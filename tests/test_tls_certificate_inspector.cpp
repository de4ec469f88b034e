#include <catch2/catch_test_macros.hpp>
#include "cert/tls_certificate_inspector.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <thread>

using namespace urlscope;

namespace {

constexpr long kDay = 24 * 60 * 60;

struct PkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
struct FileCloser { void operator()(FILE* f) const { if (f) std::fclose(f); } };

using Key = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using Cert = std::unique_ptr<X509, X509Deleter>;

Key make_key() {
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
    REQUIRE(ctx);
    REQUIRE(EVP_PKEY_keygen_init(ctx.get()) == 1);
    REQUIRE(EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) == 1);
    EVP_PKEY* key = nullptr;
    REQUIRE(EVP_PKEY_keygen(ctx.get(), &key) == 1);
    return Key(key);
}

// Self-signed "CN=localhost,O=urlscope tests", serial 0x1234, validity relative to now
Cert make_certificate(EVP_PKEY* key, long not_before_offset, long not_after_offset) {
    Cert cert(X509_new());
    REQUIRE(cert);
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 0x1234);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), not_before_offset);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), not_after_offset);
    X509_set_pubkey(cert.get(), key);

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>("urlscope tests"), -1, -1, 0);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    REQUIRE(X509_sign(cert.get(), key, EVP_sha256()) > 0);
    return cert;
}

/**
 * @brief HTTPS server on an ephemeral port presenting a generated certificate
 */
class LocalTlsServer {
public:
    LocalTlsServer() : dir_(std::filesystem::temp_directory_path() / "urlscope_tls_test") {
        std::filesystem::create_directories(dir_);
        const auto key = make_key();
        const auto cert = make_certificate(key.get(), -kDay, 90 * kDay + kDay / 2);
        const auto cert_path = (dir_ / "cert.pem").string();
        const auto key_path = (dir_ / "key.pem").string();
        {
            std::unique_ptr<FILE, FileCloser> out(std::fopen(cert_path.c_str(), "w"));
            REQUIRE(out);
            REQUIRE(PEM_write_X509(out.get(), cert.get()) == 1);
        }
        {
            std::unique_ptr<FILE, FileCloser> out(std::fopen(key_path.c_str(), "w"));
            REQUIRE(out);
            REQUIRE(PEM_write_PrivateKey(out.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) == 1);
        }

        svr_ = std::make_unique<httplib::SSLServer>(cert_path.c_str(), key_path.c_str());
        REQUIRE(svr_->is_valid());
        svr_->Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });
        port_ = svr_->bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_->listen_after_bind(); });
        while (!svr_->is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~LocalTlsServer() {
        svr_->stop();
        if (thread_.joinable()) thread_.join();
        std::filesystem::remove_all(dir_);
    }

    [[nodiscard]] uint16_t port() const { return static_cast<uint16_t>(port_); }

private:
    std::filesystem::path dir_;
    std::unique_ptr<httplib::SSLServer> svr_;
    std::thread thread_;
    int port_ = 0;
};

} // namespace

TEST_CASE("TlsCertificateInspector: describe reads names, version and serial", "[cert]") {
    const auto key = make_key();
    const auto cert = make_certificate(key.get(), -kDay, 90 * kDay + kDay / 2);

    const auto info = TlsCertificateInspector::describe(cert.get(), std::chrono::system_clock::now());
    REQUIRE(info.is_ok());
    CHECK(info.value().subject == "CN=localhost,O=urlscope tests");
    CHECK(info.value().issuer == info.value().subject);
    CHECK(info.value().version == 3);
    CHECK(info.value().serial_number == "1234");
    CHECK(info.value().days_remaining == 90);
    CHECK(info.value().valid_from < info.value().valid_to);
    CHECK(info.value().status == CertificateStatus::VALID);
}

TEST_CASE("TlsCertificateInspector: status follows the validity window", "[cert]") {
    const auto key = make_key();
    const auto now = std::chrono::system_clock::now();

    SECTION("expiring inside the warning window") {
        const auto cert = make_certificate(key.get(), -kDay, 10 * kDay + kDay / 2);
        const auto info = TlsCertificateInspector::describe(cert.get(), now, 30);
        REQUIRE(info.is_ok());
        CHECK(info.value().days_remaining == 10);
        CHECK(info.value().status == CertificateStatus::EXPIRING_SOON);

        const auto relaxed = TlsCertificateInspector::describe(cert.get(), now, 7);
        CHECK(relaxed.value().status == CertificateStatus::VALID);
    }

    SECTION("expired") {
        const auto cert = make_certificate(key.get(), -30 * kDay, -(5 * kDay + kDay / 2));
        const auto info = TlsCertificateInspector::describe(cert.get(), now);
        REQUIRE(info.is_ok());
        CHECK(info.value().days_remaining == -5);
        CHECK(info.value().status == CertificateStatus::EXPIRED);
    }

    SECTION("not yet valid") {
        const auto cert = make_certificate(key.get(), 2 * kDay, 100 * kDay);
        const auto info = TlsCertificateInspector::describe(cert.get(), now);
        REQUIRE(info.is_ok());
        CHECK(info.value().status == CertificateStatus::NOT_YET_VALID);
    }
}

TEST_CASE("TlsCertificateInspector: describe rejects a null certificate", "[cert]") {
    const auto info = TlsCertificateInspector::describe(nullptr, std::chrono::system_clock::now());
    CHECK(info.is_error());
    CHECK(info.error_category() == ErrorCategory::INTERNAL_ERROR);
}

TEST_CASE("TlsCertificateInspector: reads the certificate of a live server", "[cert][integration]") {
    LocalTlsServer server;
    TlsCertificateInspector inspector({.port = server.port(), .warning_days = 30});

    const auto info = inspector.inspect("127.0.0.1", std::chrono::milliseconds(2000));
    REQUIRE(info.is_ok());
    CHECK(info.value().host == "127.0.0.1");
    CHECK(info.value().subject == "CN=localhost,O=urlscope tests");
    CHECK(info.value().serial_number == "1234");
    CHECK(info.value().status == CertificateStatus::VALID);

    const auto stats = inspector.get_stats();
    CHECK(stats.inspections == 1);
    CHECK(stats.failures == 0);
}

TEST_CASE("TlsCertificateInspector: refused connection is a network error", "[cert][integration]") {
    TlsCertificateInspector inspector({.port = 1});

    const auto info = inspector.inspect("127.0.0.1", std::chrono::milliseconds(500));
    REQUIRE(info.is_error());
    CHECK(info.error_category() == ErrorCategory::NETWORK_ERROR);
    CHECK(info.error_message().find("127.0.0.1:1") != std::string::npos);
    CHECK(inspector.get_stats().failures == 1);
}

TEST_CASE("TlsCertificateInspector: plain HTTP port fails the handshake", "[cert][integration]") {
    httplib::Server plain;
    plain.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("plain", "text/plain");
    });
    const int port = plain.bind_to_any_port("127.0.0.1");
    std::thread thread([&plain] { plain.listen_after_bind(); });
    while (!plain.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    TlsCertificateInspector inspector({.port = static_cast<uint16_t>(port)});
    const auto info = inspector.inspect("127.0.0.1", std::chrono::milliseconds(500));
    CHECK(info.is_error());
    CHECK(info.error_message().find("TLS handshake failed") != std::string::npos);

    plain.stop();
    thread.join();
}
