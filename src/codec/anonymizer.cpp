#include "codec/anonymizer.hpp"
#include "codec/identifier_codec.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace urlscope {

std::optional<AnonymizerConfig::Mode> parse_anonymizer_mode(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "literal") return AnonymizerConfig::Mode::LITERAL;
    if (lower == "hashed") return AnonymizerConfig::Mode::HASHED;
    return std::nullopt;
}

Anonymizer::Anonymizer(AnonymizerConfig config)
    : config_(std::move(config)) {}

std::string Anonymizer::hashed_placeholder(std::string_view value) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, value.data(), value.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) throw std::runtime_error("SHA-256 digest failed");

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string out = "anon_";
    for (unsigned int i = 0; i < 6 && i < hash_len; ++i) {
        out += hex_chars[(hash[i] >> 4) & 0x0F];
        out += hex_chars[hash[i] & 0x0F];
    }
    return out;
}

std::string Anonymizer::placeholder_for(const Identifier& id) const {
    if (config_.mode == AnonymizerConfig::Mode::HASHED) {
        return hashed_placeholder(id.decoded ? *id.decoded : id.raw);
    }
    return config_.placeholder;
}

AnonymizationResult Anonymizer::apply(const Url& url, std::vector<Identifier> identifiers) const {
    AnonymizationResult result;
    result.original_url = url.serialize();
    result.referenced_urls = IdentifierCodec::referenced_urls(url);

    result.unique_domains.push_back(url.domain());
    for (const auto& ref : result.referenced_urls) {
        if (const auto parsed = Url::parse(ref)) {
            auto domain = parsed->domain();
            if (std::find(result.unique_domains.begin(), result.unique_domains.end(), domain)
                    == result.unique_domains.end()) {
                result.unique_domains.push_back(std::move(domain));
            }
        }
    }

    if (identifiers.empty()) {
        result.anonymized_url = result.original_url;
        result.decoded_url = result.original_url;
        result.stripped_url = url.without_query();
        return result;
    }

    auto anon_params = url.query_params();
    auto anon_segments = url.path_segments();
    auto decoded_params = anon_params;
    auto decoded_segments = anon_segments;
    bool query_touched = false;
    bool path_touched = false;

    std::vector<IdentifierLocation> used;
    for (auto& id : identifiers) {
        const bool overlapping = std::find(used.begin(), used.end(), id.location) != used.end();
        const bool is_query = id.location.component == IdentifierLocation::Component::QUERY;
        const bool in_range = is_query
            ? id.location.index < anon_params.size() && anon_params[id.location.index].has_value
            : id.location.index < anon_segments.size();

        if (overlapping || !in_range) {
            utils::log::warn(std::format("Anonymizer: skipping identifier at {} index {}",
                is_query ? "query" : "path", id.location.index));
            continue;
        }
        used.push_back(id.location);

        id.anonymized = placeholder_for(id);
        const std::string encoded_placeholder = utils::percent_encode(id.anonymized);
        const std::string decoded_text = id.decoded
            ? utils::percent_encode(*id.decoded)
            : (is_query ? decoded_params[id.location.index].raw_value
                        : decoded_segments[id.location.index]);

        if (is_query) {
            anon_params[id.location.index].raw_value = encoded_placeholder;
            decoded_params[id.location.index].raw_value = decoded_text;
            query_touched = true;
        } else {
            anon_segments[id.location.index] = encoded_placeholder;
            decoded_segments[id.location.index] = decoded_text;
            path_touched = true;
        }
        result.identifiers.push_back(std::move(id));
    }

    Url anonymized = url;
    Url decoded = url;
    if (query_touched) {
        anonymized.set_query_params(anon_params);
        decoded.set_query_params(decoded_params);
    }
    if (path_touched) {
        anonymized.set_path_segments(anon_segments);
        decoded.set_path_segments(decoded_segments);
    }
    result.anonymized_url = anonymized.serialize();
    result.decoded_url = decoded.serialize();
    result.stripped_url = anonymized.without_query();
    return result;
}

} // namespace urlscope
