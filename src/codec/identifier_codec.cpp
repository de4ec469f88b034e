#include "codec/identifier_codec.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace urlscope {

namespace {

bool looks_like_web_url(std::string_view value) {
    const std::string lower = utils::to_lower(value.substr(0, 8));
    return lower.starts_with("http://") || lower.starts_with("https://");
}

} // anonymous namespace

IdentifierCodec::IdentifierCodec(CodecConfig config,
                                 std::shared_ptr<const IdentifierClassifier> classifier)
    : config_(config),
      classifier_(classifier ? std::move(classifier)
                             : std::make_shared<const IdentifierClassifier>()) {}

bool IdentifierCodec::is_candidate(std::string_view span, size_t min_length) {
    if (span.size() < min_length || span.empty() || span.size() % 4 != 0) return false;

    size_t padding = 0;
    for (size_t i = 0; i < span.size(); ++i) {
        const auto c = static_cast<unsigned char>(span[i]);
        if (c == '=') {
            ++padding;
            continue;
        }
        // Data character after padding started
        if (padding > 0) return false;
        const bool in_alphabet = std::isalnum(c) || c == '+' || c == '/' || c == '-' || c == '_';
        if (!in_alphabet) return false;
    }
    return padding <= 2 && padding < span.size();
}

std::optional<Identifier> IdentifierCodec::examine(std::string_view span) const {
    if (!is_candidate(span, config_.min_candidate_length)) return std::nullopt;

    auto bytes = base64::decode(span, base64::Alphabet::STANDARD);
    if (!bytes) {
        bytes = base64::decode(span, base64::Alphabet::URL_SAFE);
    }
    if (!bytes) return std::nullopt;

    std::string text(bytes->begin(), bytes->end());

    Identifier id;
    id.raw = std::string(span);

    if (!utils::is_valid_utf8(text)) {
        if (!config_.report_binary) return std::nullopt;
        id.kind = IdentifierKind::UNRECOGNIZED;
        return id;
    }

    const auto kind = classifier_->classify(text);
    if (!kind) return std::nullopt;

    id.kind = *kind;
    id.decoded = std::move(text);
    return id;
}

std::vector<Identifier> IdentifierCodec::scan(const Url& url) const {
    std::vector<Identifier> found;

    const auto params = url.query_params();
    for (size_t i = 0; i < params.size(); ++i) {
        const auto& p = params[i];
        if (!p.has_value || p.raw_value.empty()) continue;

        const std::string value = utils::percent_decode(p.raw_value);
        if (looks_like_web_url(value)) continue;

        auto id = examine(value);
        if (!id) continue;

        id->location.component = IdentifierLocation::Component::QUERY;
        id->location.index = i;
        id->location.key = utils::percent_decode(p.raw_key);
        utils::log::debug(std::format("Identifier ({}) in query parameter '{}'",
            identifier_kind_to_string(id->kind), id->location.key));
        found.push_back(std::move(*id));
    }

    const auto segments = url.path_segments();
    for (size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].empty()) continue;

        auto id = examine(utils::percent_decode(segments[i]));
        if (!id) continue;

        id->location.component = IdentifierLocation::Component::PATH;
        id->location.index = i;
        utils::log::debug(std::format("Identifier ({}) in path segment {}",
            identifier_kind_to_string(id->kind), i));
        found.push_back(std::move(*id));
    }

    return found;
}

std::vector<Identifier> IdentifierCodec::scan(std::string_view url) const {
    const auto parsed = Url::parse(url);
    if (!parsed) return {};
    return scan(*parsed);
}

std::vector<std::string> IdentifierCodec::referenced_urls(const Url& url) {
    std::vector<std::string> refs;
    for (const auto& p : url.query_params()) {
        if (!p.has_value) continue;
        std::string value = utils::percent_decode(p.raw_value);
        if (looks_like_web_url(value) && Url::parse(value)) {
            refs.push_back(std::move(value));
        }
    }
    return refs;
}

} // namespace urlscope
