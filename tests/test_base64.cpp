#include <catch2/catch_test_macros.hpp>
#include "core/base64.hpp"

using namespace urlscope;

namespace {

std::string as_text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST_CASE("Base64: encode known vectors", "[base64]") {
    CHECK(base64::encode(std::string_view("")) == "");
    CHECK(base64::encode(std::string_view("f")) == "Zg==");
    CHECK(base64::encode(std::string_view("fo")) == "Zm8=");
    CHECK(base64::encode(std::string_view("foo")) == "Zm9v");
    CHECK(base64::encode(std::string_view("example@example.com")) == "ZXhhbXBsZUBleGFtcGxlLmNvbQ==");
}

TEST_CASE("Base64: URL-safe alphabet", "[base64]") {
    const std::string bytes = "\xfb\xff\xbf";
    CHECK(base64::encode(bytes, base64::Alphabet::STANDARD) == "+/+/");
    CHECK(base64::encode(bytes, base64::Alphabet::URL_SAFE) == "-_-_");

    const auto decoded = base64::decode("-_-_", base64::Alphabet::URL_SAFE);
    REQUIRE(decoded.has_value());
    CHECK(as_text(*decoded) == bytes);
    CHECK_FALSE(base64::decode("-_-_", base64::Alphabet::STANDARD).has_value());
}

TEST_CASE("Base64: decode accepts padded input", "[base64]") {
    const auto decoded = base64::decode("ZXhhbXBsZUBleGFtcGxlLmNvbQ==");
    REQUIRE(decoded.has_value());
    CHECK(as_text(*decoded) == "example@example.com");
}

TEST_CASE("Base64: decode is strict", "[base64]") {
    CHECK_FALSE(base64::decode("").has_value());
    CHECK_FALSE(base64::decode("Zm9").has_value());        // length not a multiple of 4
    CHECK_FALSE(base64::decode("Zm9v!A==").has_value());   // outside alphabet
    CHECK_FALSE(base64::decode("Z=9v").has_value());       // padding in the middle
    CHECK_FALSE(base64::decode("Zg=a").has_value());       // data after padding
    CHECK_FALSE(base64::decode("Zh==").has_value());       // non-zero trailing bits
    CHECK_FALSE(base64::decode("====").has_value());
}
