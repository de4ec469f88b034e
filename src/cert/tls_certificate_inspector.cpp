#include "cert/tls_certificate_inspector.hpp"
#include "core/utils.hpp"
#include "net/tcp_connection.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <arpa/inet.h>

#include <ctime>
#include <format>
#include <memory>
#include <optional>

namespace urlscope {

// ============================================================================
// Anonymous namespace helpers
// ============================================================================

namespace {

struct SslCtxDeleter { void operator()(SSL_CTX* p) const { if (p) SSL_CTX_free(p); } };
struct SslDeleter { void operator()(SSL* p) const { if (p) SSL_free(p); } };
struct X509Deleter { void operator()(X509* p) const { if (p) X509_free(p); } };
struct BioDeleter { void operator()(BIO* p) const { if (p) BIO_free(p); } };
struct BignumDeleter { void operator()(BIGNUM* p) const { if (p) BN_free(p); } };

std::string openssl_error() {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

std::optional<std::string> name_to_string(X509_NAME* name) {
    if (!name) return std::nullopt;
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new(BIO_s_mem()));
    if (!bio || X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0) {
        return std::nullopt;
    }
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || !data) return std::string{};
    return std::string(data, static_cast<size_t>(len));
}

std::optional<std::chrono::system_clock::time_point> to_time_point(const ASN1_TIME* t) {
    std::tm tm{};
    if (!t || ASN1_TIME_to_tm(t, &tm) != 1) return std::nullopt;
    return std::chrono::system_clock::from_time_t(::timegm(&tm));
}

std::optional<std::string> serial_hex(const X509* cert) {
    const ASN1_INTEGER* serial = X509_get0_serialNumber(cert);
    if (!serial) return std::nullopt;
    std::unique_ptr<BIGNUM, BignumDeleter> bn(ASN1_INTEGER_to_BN(serial, nullptr));
    if (!bn) return std::nullopt;
    char* hex = BN_bn2hex(bn.get());
    if (!hex) return std::nullopt;
    std::string out(hex);
    OPENSSL_free(hex);
    return out;
}

} // anonymous namespace

// ============================================================================
// TlsCertificateInspector
// ============================================================================

TlsCertificateInspector::TlsCertificateInspector()
    : TlsCertificateInspector(Config{}) {}

TlsCertificateInspector::TlsCertificateInspector(Config config)
    : config_(config) {}

Result<CertificateInfo> TlsCertificateInspector::inspect(const std::string& host,
                                                         std::chrono::milliseconds timeout) {
    using R = Result<CertificateInfo>;
    inspections_.fetch_add(1, std::memory_order_relaxed);

    auto fail = [this, &host](ErrorCategory category, const std::string& message) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return R::error(category, std::format("TLS inspection of {}:{} failed: {}",
            host, config_.port, message));
    };

    auto conn = TcpConnection::connect(host, config_.port, timeout);
    if (conn.is_error()) {
        return fail(conn.error_category(), conn.error_message());
    }

    std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        return fail(ErrorCategory::INTERNAL_ERROR, openssl_error());
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);

    std::unique_ptr<SSL, SslDeleter> ssl(SSL_new(ctx.get()));
    if (!ssl || SSL_set_fd(ssl.get(), conn.value().fd()) != 1) {
        return fail(ErrorCategory::INTERNAL_ERROR, openssl_error());
    }
    if (!is_ip_literal(host)) {
        SSL_set_tlsext_host_name(ssl.get(), host.c_str());
    }

    ERR_clear_error();
    if (SSL_connect(ssl.get()) != 1) {
        return fail(ErrorCategory::NETWORK_ERROR, std::format("TLS handshake failed: {}", openssl_error()));
    }

#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    std::unique_ptr<X509, X509Deleter> cert(SSL_get1_peer_certificate(ssl.get()));
#else
    std::unique_ptr<X509, X509Deleter> cert(SSL_get_peer_certificate(ssl.get()));
#endif
    SSL_shutdown(ssl.get());
    if (!cert) {
        return fail(ErrorCategory::NETWORK_ERROR, "server presented no certificate");
    }

    auto info = describe(cert.get(), utils::now(), config_.warning_days);
    if (info.is_error()) {
        return fail(info.error_category(), info.error_message());
    }
    info.value().host = host;

    utils::log::debug(std::format("Certificate of {}: {} ({} days remaining)",
        host, certificate_status_to_string(info.value().status), info.value().days_remaining));
    return info;
}

Result<CertificateInfo> TlsCertificateInspector::describe(X509* cert,
                                                          std::chrono::system_clock::time_point now,
                                                          uint32_t warning_days) {
    using R = Result<CertificateInfo>;
    if (!cert) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "no certificate");
    }

    CertificateInfo info;

    auto issuer = name_to_string(X509_get_issuer_name(cert));
    auto subject = name_to_string(X509_get_subject_name(cert));
    if (!issuer || !subject) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "unreadable certificate names");
    }
    info.issuer = std::move(*issuer);
    info.subject = std::move(*subject);

    const auto not_before = to_time_point(X509_get0_notBefore(cert));
    const auto not_after = to_time_point(X509_get0_notAfter(cert));
    if (!not_before || !not_after) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "unreadable certificate validity");
    }
    info.valid_from = *not_before;
    info.valid_to = *not_after;
    info.days_remaining =
        std::chrono::duration_cast<std::chrono::hours>(info.valid_to - now).count() / 24;

    info.version = static_cast<uint32_t>(X509_get_version(cert) + 1);
    info.serial_number = serial_hex(cert).value_or("");

    if (now < info.valid_from) {
        info.status = CertificateStatus::NOT_YET_VALID;
    } else if (now > info.valid_to) {
        info.status = CertificateStatus::EXPIRED;
    } else if (info.days_remaining < static_cast<int64_t>(warning_days)) {
        info.status = CertificateStatus::EXPIRING_SOON;
    } else {
        info.status = CertificateStatus::VALID;
    }
    return R::ok(std::move(info));
}

} // namespace urlscope
