#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace urlscope {

/**
 * @brief One `key=value` piece of a query string, as it appears on the wire
 */
struct QueryParam {
    std::string raw_key;
    std::string raw_value;
    bool has_value = false;     // false for "flag" pieces without '='
};

/**
 * @brief Absolute hierarchical URL split into raw components
 *
 * Components are kept exactly as written (no case folding, no
 * normalization) so that serialize() reproduces the parsed input
 * byte-for-byte. Mutators rebuild only the component they touch.
 */
class Url {
public:
    /**
     * @brief Parse `scheme://authority[path][?query][#fragment]`
     * @return std::nullopt when the text is not an absolute URL with a host,
     *         has an invalid port, or contains whitespace/control characters
     */
    [[nodiscard]] static std::optional<Url> parse(std::string_view text);

    [[nodiscard]] std::string serialize() const;

    // ---- Raw components ----------------------------------------------------

    [[nodiscard]] const std::string& scheme() const { return scheme_; }
    [[nodiscard]] const std::string& authority() const { return authority_; }
    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] std::optional<uint16_t> port() const { return port_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::optional<std::string>& query() const { return query_; }
    [[nodiscard]] const std::optional<std::string>& fragment() const { return fragment_; }

    // Lowercased scheme, e.g. "https"
    [[nodiscard]] std::string scheme_lower() const;

    // Lowercased host without IPv6 brackets, e.g. "www.example.com" or "::1"
    [[nodiscard]] std::string hostname() const;

    // hostname() without a leading "www."
    [[nodiscard]] std::string domain() const;

    // scheme://host[:port] (lowercased scheme), suitable for an HTTP client
    [[nodiscard]] std::string origin() const;

    // path (or "/") plus "?query"; fragment excluded
    [[nodiscard]] std::string request_target() const;

    // Serialized URL with query and fragment dropped
    [[nodiscard]] std::string without_query() const;

    // ---- Structured views --------------------------------------------------

    // Pieces of the query split on '&', in order; empty when there is no query
    [[nodiscard]] std::vector<QueryParam> query_params() const;

    // Path split on '/' after the leading slash: "/a/b/" -> {"a", "b", ""}
    [[nodiscard]] std::vector<std::string> path_segments() const;

    void set_query_params(const std::vector<QueryParam>& params);
    void set_path_segments(const std::vector<std::string>& segments);

private:
    Url() = default;

    std::string scheme_;
    std::string authority_;
    std::string host_;
    std::optional<uint16_t> port_;
    std::string path_;
    std::optional<std::string> query_;
    std::optional<std::string> fragment_;
};

/**
 * @brief Resolve a Location-style reference against a base URL (RFC 3986 §5.2)
 *
 * Handles absolute, scheme-relative ("//host/x"), absolute-path, relative-path,
 * query-only and fragment-only references, with dot-segment removal.
 * @return Resolved absolute URL text, or std::nullopt if the reference contains
 *         whitespace/control characters after trimming
 */
[[nodiscard]] std::optional<std::string> resolve_reference(const Url& base,
                                                           std::string_view reference);

/**
 * @brief RFC 3986 §5.2.4 remove_dot_segments
 */
[[nodiscard]] std::string remove_dot_segments(std::string_view path);

} // namespace urlscope
