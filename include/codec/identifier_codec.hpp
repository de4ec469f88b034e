#pragma once

#include "classifier/identifier_classifier.hpp"
#include "core/types.hpp"
#include "core/url.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace urlscope {

struct CodecConfig {
    size_t min_candidate_length = 8;    // encoded characters
    bool report_binary = false;         // emit UNRECOGNIZED for non-text payloads
};

/**
 * @brief Finds base64-encoded identifiers in query values and path segments
 *
 * Stateless apart from configuration; safe to share across threads.
 */
class IdentifierCodec {
public:
    explicit IdentifierCodec(CodecConfig config = {},
                             std::shared_ptr<const IdentifierClassifier> classifier = nullptr);

    /**
     * @brief Scan query values (declaration order) then path segments (left to right)
     * @return Identifiers with kind and location set; `anonymized` is left empty
     */
    [[nodiscard]] std::vector<Identifier> scan(const Url& url) const;

    // Convenience overload; unparseable input yields no identifiers
    [[nodiscard]] std::vector<Identifier> scan(std::string_view url) const;

    /**
     * @brief Decode and classify a single span (already percent-decoded)
     * @return std::nullopt when the span is not a candidate, fails to decode,
     *         or its text matches no rule
     */
    [[nodiscard]] std::optional<Identifier> examine(std::string_view span) const;

    /**
     * @brief Shape check: length % 4 == 0, >= min_length, base64 alphabet
     *        (standard or URL-safe), at most two trailing '='
     */
    [[nodiscard]] static bool is_candidate(std::string_view span, size_t min_length);

    /**
     * @brief Percent-decoded query values that are themselves http(s) URLs
     */
    [[nodiscard]] static std::vector<std::string> referenced_urls(const Url& url);

    [[nodiscard]] const CodecConfig& config() const { return config_; }

private:
    CodecConfig config_;
    std::shared_ptr<const IdentifierClassifier> classifier_;
};

} // namespace urlscope
