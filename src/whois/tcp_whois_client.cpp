#include "whois/tcp_whois_client.hpp"
#include "core/utils.hpp"
#include "net/tcp_connection.hpp"

#include <format>
#include <vector>

namespace urlscope {

namespace {

using WhoisField = std::optional<std::string> WhoisInfo::*;

WhoisField field_for(const std::string& key) {
    if (key == "organisation" || key == "organization" || key == "orgname" ||
        key == "registrant organization" || key == "org-name") {
        return &WhoisInfo::organisation;
    }
    if (key == "registrar") return &WhoisInfo::registrar;
    if (key == "created" || key == "creation date" || key == "registered") {
        return &WhoisInfo::created;
    }
    if (key == "changed" || key == "updated date" || key == "last-modified" || key == "last modified") {
        return &WhoisInfo::changed;
    }
    if (key == "registry expiry date" || key == "registrar registration expiration date" ||
        key == "expiry date" || key == "expires") {
        return &WhoisInfo::expires;
    }
    return nullptr;
}

// Calls fn(lowercased key, trimmed value) for every "key: value" line
template<typename Fn>
void for_each_field(std::string_view raw, Fn&& fn) {
    size_t pos = 0;
    while (pos < raw.size()) {
        size_t eol = raw.find('\n', pos);
        if (eol == std::string_view::npos) eol = raw.size();
        std::string_view line = raw.substr(pos, eol - pos);
        pos = eol + 1;

        if (line.empty() || line.front() == '%' || line.front() == '#') continue;
        const size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;

        const std::string key = utils::to_lower(utils::trim(std::string(line.substr(0, colon))));
        const std::string value = utils::trim(std::string(line.substr(colon + 1)));
        if (key.empty() || value.empty()) continue;
        fn(key, value);
    }
}

void fill_missing(WhoisInfo& into, const WhoisInfo& from) {
    for (WhoisField field : {&WhoisInfo::organisation, &WhoisInfo::registrar, &WhoisInfo::created,
                             &WhoisInfo::changed, &WhoisInfo::expires}) {
        if (!(into.*field) && (from.*field)) into.*field = from.*field;
    }
}

} // anonymous namespace

TcpWhoisClient::TcpWhoisClient()
    : TcpWhoisClient(Config{}) {}

TcpWhoisClient::TcpWhoisClient(Config config)
    : config_(std::move(config)) {}

WhoisInfo TcpWhoisClient::parse_response(const std::string& domain,
                                         const std::string& server,
                                         std::string_view raw) {
    WhoisInfo info;
    info.domain = domain;
    info.server = server;
    for_each_field(raw, [&info](const std::string& key, const std::string& value) {
        if (WhoisField field = field_for(key); field && !(info.*field)) {
            info.*field = value;
        }
    });
    return info;
}

std::optional<std::string> TcpWhoisClient::referral(std::string_view raw) {
    std::optional<std::string> next;
    for_each_field(raw, [&next](const std::string& key, const std::string& value) {
        if (next) return;
        if (key != "refer" && key != "whois" && key != "registrar whois server" && key != "whois server") {
            return;
        }
        std::string_view server = value;
        if (const size_t scheme = server.find("://"); scheme != std::string_view::npos) {
            server.remove_prefix(scheme + 3);
        }
        server = server.substr(0, server.find_first_of("/ \t"));
        if (!server.empty()) next = utils::to_lower(server);
    });
    return next;
}

Result<std::string> TcpWhoisClient::query(const std::string& server,
                                          const std::string& domain,
                                          std::chrono::milliseconds timeout) const {
    auto conn = TcpConnection::connect(server, config_.port, timeout);
    if (conn.is_error()) {
        return Result<std::string>::error(conn.error_category(), conn.error_message());
    }
    if (!conn.value().write_all(domain + "\r\n")) {
        return Result<std::string>::error(ErrorCategory::NETWORK_ERROR,
            std::format("sending query to {} failed", server));
    }
    return conn.value().read_all(kMaxResponseBytes);
}

Result<WhoisInfo> TcpWhoisClient::lookup(const std::string& domain,
                                         std::chrono::milliseconds timeout) {
    lookups_.fetch_add(1, std::memory_order_relaxed);

    auto first = query(config_.server, domain, timeout);
    if (first.is_error()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return Result<WhoisInfo>::error(first.error_category(),
            std::format("WHOIS lookup of {} via {} failed: {}", domain, config_.server, first.error_message()));
    }

    std::vector<WhoisInfo> answers;
    answers.push_back(parse_response(domain, config_.server, first.value()));

    std::string server = config_.server;
    std::string raw = std::move(first.value());
    for (size_t hop = 0; config_.follow_referrals && hop < kMaxReferrals; ++hop) {
        const auto next = referral(raw);
        if (!next || *next == utils::to_lower(server)) break;

        auto response = query(*next, domain, timeout);
        if (response.is_error()) {
            utils::log::warn(std::format("WHOIS referral for {} to {} failed: {}",
                domain, *next, response.error_message()));
            break;
        }
        referrals_followed_.fetch_add(1, std::memory_order_relaxed);
        server = *next;
        raw = std::move(response.value());
        answers.push_back(parse_response(domain, server, raw));
    }

    // answers[0] is the root server's; it only stands when nothing else answered
    WhoisInfo merged = answers.back();
    for (size_t i = answers.size() - 1; i-- > 1;) {
        fill_missing(merged, answers[i]);
    }

    utils::log::debug(std::format("WHOIS {}: answered by {} after {} server(s)",
        domain, merged.server, answers.size()));
    return Result<WhoisInfo>::ok(std::move(merged));
}

} // namespace urlscope
