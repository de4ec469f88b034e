#include "core/url.hpp"
#include "core/utils.hpp"

#include <cctype>

namespace urlscope {

namespace {

bool has_forbidden_chars(std::string_view s) {
    for (const char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        if (c <= 0x20 || c == 0x7F) return true;
    }
    return false;
}

// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ), returns length or 0
size_t scheme_length(std::string_view s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return 0;
    size_t i = 1;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (std::isalnum(c) || c == '+' || c == '-' || c == '.') {
            ++i;
            continue;
        }
        break;
    }
    return (i < s.size() && s[i] == ':') ? i : 0;
}

/**
 * @brief Generic reference split (RFC 3986 Appendix B), no validation
 */
struct Reference {
    std::optional<std::string> scheme;
    std::optional<std::string> authority;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;
};

Reference split_reference(std::string_view s) {
    Reference r;

    if (const auto hash = s.find('#'); hash != std::string_view::npos) {
        r.fragment = std::string(s.substr(hash + 1));
        s = s.substr(0, hash);
    }
    if (const auto q = s.find('?'); q != std::string_view::npos) {
        r.query = std::string(s.substr(q + 1));
        s = s.substr(0, q);
    }
    if (const size_t len = scheme_length(s); len > 0) {
        r.scheme = std::string(s.substr(0, len));
        s = s.substr(len + 1);
    }
    if (s.starts_with("//")) {
        s = s.substr(2);
        const auto slash = s.find('/');
        r.authority = std::string(s.substr(0, slash));
        s = (slash == std::string_view::npos) ? std::string_view{} : s.substr(slash);
    }
    r.path = std::string(s);
    return r;
}

std::string compose(const Reference& r) {
    std::string out;
    if (r.scheme) {
        out += *r.scheme;
        out += ':';
    }
    if (r.authority) {
        out += "//";
        out += *r.authority;
    }
    out += r.path;
    if (r.query) {
        out += '?';
        out += *r.query;
    }
    if (r.fragment) {
        out += '#';
        out += *r.fragment;
    }
    return out;
}

std::string merge_paths(const Url& base, const std::string& ref_path) {
    if (base.path().empty()) {
        return "/" + ref_path;
    }
    const auto slash = base.path().rfind('/');
    if (slash == std::string::npos) return ref_path;
    return base.path().substr(0, slash + 1) + ref_path;
}

} // anonymous namespace

// ============================================================================
// Parsing / serialization
// ============================================================================

std::optional<Url> Url::parse(std::string_view text) {
    if (text.empty() || has_forbidden_chars(text)) return std::nullopt;

    const Reference r = split_reference(text);
    if (!r.scheme || !r.authority) return std::nullopt;

    Url url;
    url.scheme_ = *r.scheme;
    url.authority_ = *r.authority;
    url.path_ = r.path;
    url.query_ = r.query;
    url.fragment_ = r.fragment;

    // Strip userinfo
    std::string_view host_port = url.authority_;
    if (const auto at = host_port.rfind('@'); at != std::string_view::npos) {
        host_port = host_port.substr(at + 1);
    }

    std::string_view port_text;
    if (host_port.starts_with("[")) {
        const auto close = host_port.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        url.host_ = std::string(host_port.substr(0, close + 1));
        const auto rest = host_port.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') return std::nullopt;
            port_text = rest.substr(1);
        }
    } else {
        const auto colon = host_port.rfind(':');
        if (colon != std::string_view::npos) {
            port_text = host_port.substr(colon + 1);
            host_port = host_port.substr(0, colon);
        }
        url.host_ = std::string(host_port);
    }

    if (url.host_.empty() || url.host_ == "[]") return std::nullopt;

    if (!port_text.empty()) {
        const auto port = utils::try_parse_int<uint32_t>(port_text);
        if (!port || *port > 65535) return std::nullopt;
        url.port_ = static_cast<uint16_t>(*port);
    }

    return url;
}

std::string Url::serialize() const {
    Reference r;
    r.scheme = scheme_;
    r.authority = authority_;
    r.path = path_;
    r.query = query_;
    r.fragment = fragment_;
    return compose(r);
}

std::string Url::scheme_lower() const {
    return utils::to_lower(scheme_);
}

std::string Url::hostname() const {
    std::string h = utils::to_lower(host_);
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']') {
        h = h.substr(1, h.size() - 2);
    }
    return h;
}

std::string Url::domain() const {
    std::string d = hostname();
    if (d.starts_with("www.")) d.erase(0, 4);
    return d;
}

std::string Url::without_query() const {
    Url stripped = *this;
    stripped.query_.reset();
    stripped.fragment_.reset();
    return stripped.serialize();
}

std::string Url::origin() const {
    std::string out = scheme_lower() + "://" + host_;
    if (port_) out += ":" + std::to_string(*port_);
    return out;
}

std::string Url::request_target() const {
    std::string out = path_.empty() ? "/" : path_;
    if (query_) {
        out += '?';
        out += *query_;
    }
    return out;
}

// ============================================================================
// Structured views
// ============================================================================

std::vector<QueryParam> Url::query_params() const {
    std::vector<QueryParam> params;
    if (!query_) return params;

    size_t start = 0;
    while (true) {
        const auto amp = query_->find('&', start);
        const std::string_view piece = std::string_view(*query_).substr(
            start, amp == std::string::npos ? std::string::npos : amp - start);

        QueryParam p;
        if (const auto eq = piece.find('='); eq != std::string_view::npos) {
            p.raw_key = std::string(piece.substr(0, eq));
            p.raw_value = std::string(piece.substr(eq + 1));
            p.has_value = true;
        } else {
            p.raw_key = std::string(piece);
        }
        params.push_back(std::move(p));

        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return params;
}

std::vector<std::string> Url::path_segments() const {
    std::vector<std::string> segments;
    if (path_.empty()) return segments;

    const std::string_view body = std::string_view(path_).substr(path_[0] == '/' ? 1 : 0);
    size_t start = 0;
    while (true) {
        const auto slash = body.find('/', start);
        segments.emplace_back(body.substr(
            start, slash == std::string_view::npos ? std::string_view::npos : slash - start));
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }
    return segments;
}

void Url::set_query_params(const std::vector<QueryParam>& params) {
    std::string q;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) q += '&';
        q += params[i].raw_key;
        if (params[i].has_value) {
            q += '=';
            q += params[i].raw_value;
        }
    }
    query_ = std::move(q);
}

void Url::set_path_segments(const std::vector<std::string>& segments) {
    std::string p;
    for (const auto& seg : segments) {
        p += '/';
        p += seg;
    }
    path_ = std::move(p);
}

// ============================================================================
// Reference resolution
// ============================================================================

std::string remove_dot_segments(std::string_view path) {
    std::string input(path);
    std::string output;

    auto drop_last_segment = [&output] {
        const auto slash = output.rfind('/');
        output.erase(slash == std::string::npos ? 0 : slash);
    };

    while (!input.empty()) {
        if (input.starts_with("../")) {
            input.erase(0, 3);
        } else if (input.starts_with("./")) {
            input.erase(0, 2);
        } else if (input.starts_with("/./")) {
            input.erase(0, 2);
        } else if (input == "/.") {
            input = "/";
        } else if (input.starts_with("/../")) {
            input.erase(0, 3);
            drop_last_segment();
        } else if (input == "/..") {
            input = "/";
            drop_last_segment();
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            const size_t next = input.find('/', input[0] == '/' ? 1 : 0);
            output += input.substr(0, next);
            input.erase(0, next == std::string::npos ? input.size() : next);
        }
    }
    return output;
}

std::optional<std::string> resolve_reference(const Url& base, std::string_view reference) {
    const std::string trimmed = utils::trim(std::string(reference));
    if (has_forbidden_chars(trimmed)) return std::nullopt;

    const Reference r = split_reference(trimmed);
    Reference t;

    if (r.scheme) {
        t.scheme = r.scheme;
        t.authority = r.authority;
        t.path = remove_dot_segments(r.path);
        t.query = r.query;
    } else {
        t.scheme = base.scheme();
        if (r.authority) {
            t.authority = r.authority;
            t.path = remove_dot_segments(r.path);
            t.query = r.query;
        } else {
            t.authority = base.authority();
            if (r.path.empty()) {
                t.path = base.path();
                t.query = r.query ? r.query : base.query();
            } else {
                if (r.path.starts_with("/")) {
                    t.path = remove_dot_segments(r.path);
                } else {
                    t.path = remove_dot_segments(merge_paths(base, r.path));
                }
                t.query = r.query;
            }
        }
    }
    t.fragment = r.fragment;
    return compose(t);
}

} // namespace urlscope
