#pragma once

#include "core/types.hpp"
#include "core/url.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace urlscope {

struct AnonymizerConfig {
    enum class Mode {
        LITERAL,    // every identifier becomes `placeholder`
        HASHED      // "anon_" + 12 hex chars of SHA-256(decoded)
    };

    Mode mode = Mode::LITERAL;
    std::string placeholder = "anonymized_value";
};

[[nodiscard]] std::optional<AnonymizerConfig::Mode> parse_anonymizer_mode(std::string_view name);

/**
 * @brief Rewrites a URL with each identifier's component replaced by a placeholder
 *
 * Only the query pieces / path segments that carry an identifier are rebuilt;
 * every other byte of the URL is preserved.
 */
class Anonymizer {
public:
    explicit Anonymizer(AnonymizerConfig config = {});

    /**
     * @brief Replace identifiers (discovery order) and assemble the result
     *
     * A second identifier at an already-replaced location is skipped and
     * dropped from the result. With no identifiers, anonymized_url equals
     * original_url and the identifier list is empty.
     */
    [[nodiscard]] AnonymizationResult apply(const Url& url,
                                            std::vector<Identifier> identifiers) const;

    [[nodiscard]] std::string placeholder_for(const Identifier& id) const;

    /**
     * @brief "anon_" + first 12 hex digits of SHA-256(value), via OpenSSL EVP
     */
    [[nodiscard]] static std::string hashed_placeholder(std::string_view value);

    [[nodiscard]] const AnonymizerConfig& config() const { return config_; }

private:
    AnonymizerConfig config_;
};

} // namespace urlscope
