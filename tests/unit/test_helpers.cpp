#include "helpers.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("Big-endian helpers", "[helpers]") {
    std::vector<uint8_t> out;
    write_be32(out, 0xAE426082u);
    REQUIRE(out == std::vector<uint8_t>{0xAE, 0x42, 0x60, 0x82});
    REQUIRE(read_be32(out, 0) == 0xAE426082u);

    std::vector<uint8_t> padded = {0xFF, 0x00, 0x00, 0x00, 0x2A};
    REQUIRE(read_be32(padded, 1) == 42u);
}

TEST_CASE("UTF-8 validation", "[helpers]") {
    auto bytes = [](std::initializer_list<uint8_t> b) { return std::vector<uint8_t>(b); };

    SECTION("Accepts well-formed input") {
        REQUIRE(is_valid_utf8({}));
        REQUIRE(is_valid_utf8(bytes({'a', 'b', 'c'})));
        REQUIRE(is_valid_utf8(bytes({0xC3, 0xBC})));              // U+00FC
        REQUIRE(is_valid_utf8(bytes({0xE2, 0x82, 0xAC})));        // U+20AC
        REQUIRE(is_valid_utf8(bytes({0xF0, 0x9F, 0x98, 0x80})));  // U+1F600
        REQUIRE(is_valid_utf8(bytes({0xF4, 0x8F, 0xBF, 0xBF})));  // U+10FFFF
    }

    SECTION("Rejects malformed input") {
        REQUIRE_FALSE(is_valid_utf8(bytes({0xC3, 0x28})));              // bad continuation
        REQUIRE_FALSE(is_valid_utf8(bytes({0xC0, 0xAF})));              // overlong
        REQUIRE_FALSE(is_valid_utf8(bytes({0xE0, 0x80, 0xAF})));        // overlong
        REQUIRE_FALSE(is_valid_utf8(bytes({0xED, 0xA0, 0x80})));        // surrogate
        REQUIRE_FALSE(is_valid_utf8(bytes({0xF4, 0x90, 0x80, 0x80})));  // > U+10FFFF
        REQUIRE_FALSE(is_valid_utf8(bytes({0xE2, 0x82})));              // truncated
        REQUIRE_FALSE(is_valid_utf8(bytes({0x80})));                    // stray continuation
        REQUIRE_FALSE(is_valid_utf8(bytes({0xFF})));
    }
}

TEST_CASE("Hex formatting", "[helpers]") {
    REQUIRE(to_hex(0) == "0");
    REQUIRE(to_hex(0x21) == "21");
    REQUIRE(to_hex(0xAE426082u) == "ae426082");

    REQUIRE(hex_preview({0x00, 0xAB, 0x10}) == "00 ab 10");
    REQUIRE(hex_preview({0x01, 0x02, 0x03}, 2) == "01 02 ...");
    REQUIRE(hex_preview({}).empty());
}
