#include <catch2/catch_test_macros.hpp>
#include "codec/identifier_codec.hpp"
#include "core/base64.hpp"

using namespace urlscope;

namespace {

std::string decode_text(const std::string& raw) {
    auto bytes = base64::decode(raw, base64::Alphabet::STANDARD);
    if (!bytes) bytes = base64::decode(raw, base64::Alphabet::URL_SAFE);
    REQUIRE(bytes.has_value());
    return std::string(bytes->begin(), bytes->end());
}

} // namespace

TEST_CASE("IdentifierCodec: email in query value", "[codec]") {
    IdentifierCodec codec;
    const auto ids = codec.scan("https://example.com/verify?email=ZXhhbXBsZUBleGFtcGxlLmNvbQ==");

    REQUIRE(ids.size() == 1);
    CHECK(ids[0].raw == "ZXhhbXBsZUBleGFtcGxlLmNvbQ==");
    REQUIRE(ids[0].decoded.has_value());
    CHECK(*ids[0].decoded == "example@example.com");
    CHECK(ids[0].kind == IdentifierKind::EMAIL);
    CHECK(ids[0].location.component == IdentifierLocation::Component::QUERY);
    CHECK(ids[0].location.index == 0);
    CHECK(ids[0].location.key == "email");
    CHECK(ids[0].anonymized.empty());
}

TEST_CASE("IdentifierCodec: percent-encoded padding is decoded first", "[codec]") {
    IdentifierCodec codec;
    const auto ids = codec.scan("https://example.com/?e=am9obi5kb2VAZXhhbXBsZS5vcmc%3D");
    REQUIRE(ids.size() == 1);
    CHECK(ids[0].raw == "am9obi5kb2VAZXhhbXBsZS5vcmc=");
    CHECK(ids[0].decoded == "john.doe@example.org");
}

TEST_CASE("IdentifierCodec: query values come before path segments", "[codec]") {
    IdentifierCodec codec;
    const auto ids = codec.scan(
        "https://example.com/u/KzE1NTUxMjM0NTY3/profile?ref=dXNlci0xMjM0LWFiY2Q=&lang=en");

    REQUIRE(ids.size() == 2);
    CHECK(ids[0].kind == IdentifierKind::GENERIC);
    CHECK(ids[0].decoded == "user-1234-abcd");
    CHECK(ids[0].location.component == IdentifierLocation::Component::QUERY);
    CHECK(ids[0].location.key == "ref");

    CHECK(ids[1].kind == IdentifierKind::PHONE);
    CHECK(ids[1].decoded == "+15551234567");
    CHECK(ids[1].location.component == IdentifierLocation::Component::PATH);
    CHECK(ids[1].location.index == 1);
}

TEST_CASE("IdentifierCodec: URL-safe alphabet", "[codec]") {
    IdentifierCodec codec;
    const auto ids = codec.scan("https://example.com/t/Pz4_Pj8-");
    REQUIRE(ids.size() == 1);
    CHECK(ids[0].decoded == "?>?>?>");
    CHECK(ids[0].kind == IdentifierKind::GENERIC);
}

TEST_CASE("IdentifierCodec: ordinary URLs yield nothing", "[codec]") {
    IdentifierCodec codec;
    CHECK(codec.scan("https://example.com/").empty());
    CHECK(codec.scan("https://example.com/products/checkout?page=2&sort=price").empty());
    CHECK(codec.scan("https://example.com/?id=Zm9v").empty());          // shorter than 8
    CHECK(codec.scan("https://example.com/?flag&empty=").empty());
    CHECK(codec.scan("not a url").empty());
}

TEST_CASE("IdentifierCodec: binary payloads", "[codec]") {
    const std::string url = "https://example.com/?blob=//79/Pv6";

    IdentifierCodec quiet;
    CHECK(quiet.scan(url).empty());

    CodecConfig cfg;
    cfg.report_binary = true;
    IdentifierCodec reporting(cfg);
    const auto ids = reporting.scan(url);
    REQUIRE(ids.size() == 1);
    CHECK(ids[0].kind == IdentifierKind::UNRECOGNIZED);
    CHECK_FALSE(ids[0].decoded.has_value());
    CHECK(ids[0].raw == "//79/Pv6");
}

TEST_CASE("IdentifierCodec: embedded URLs are not candidates", "[codec]") {
    IdentifierCodec codec;
    const auto url = Url::parse(
        "https://example.com/?next=https%3A%2F%2Fother.example%2Fpage&x=1&bad=http%3A%2F%2F");
    REQUIRE(url.has_value());
    CHECK(codec.scan(*url).empty());

    const auto refs = IdentifierCodec::referenced_urls(*url);
    REQUIRE(refs.size() == 1);
    CHECK(refs[0] == "https://other.example/page");
}

TEST_CASE("IdentifierCodec: is_candidate shape rules", "[codec]") {
    CHECK(IdentifierCodec::is_candidate("Zm9vYmFy", 8));
    CHECK(IdentifierCodec::is_candidate("Zm9vYg==", 8));
    CHECK(IdentifierCodec::is_candidate("Pz4_Pj8-", 8));
    CHECK_FALSE(IdentifierCodec::is_candidate("Zm9vYmF", 4));      // length % 4
    CHECK_FALSE(IdentifierCodec::is_candidate("Zm9v", 8));         // too short
    CHECK_FALSE(IdentifierCodec::is_candidate("Zm9v.mFy", 8));     // alphabet
    CHECK_FALSE(IdentifierCodec::is_candidate("Zm9=YmFy", 8));     // padding inside
    CHECK_FALSE(IdentifierCodec::is_candidate("Zm9vY===", 8));     // three '='
    CHECK_FALSE(IdentifierCodec::is_candidate("", 0));
}

TEST_CASE("IdentifierCodec: decoded text round-trips from raw", "[codec][property]") {
    IdentifierCodec codec;
    const auto ids = codec.scan(
        "https://example.com/a/KzE1NTUxMjM0NTY3/Pz4_Pj8-"
        "?e=ZXhhbXBsZUBleGFtcGxlLmNvbQ==&g=aGVsbG8gd29ybGQh");
    REQUIRE(ids.size() == 4);
    for (const auto& id : ids) {
        REQUIRE(id.decoded.has_value());
        CHECK(decode_text(id.raw) == *id.decoded);
    }
}
