/**
 * @file test_transform.cpp
 * @brief Unit tests for payload transforms.
 */

#include <catch2/catch_test_macros.hpp>

#include "archive/transform.hpp"

#include "test_utils.hpp"

using namespace sfxpack::archive;
using test_helpers::noise_bytes;
using test_helpers::repeated_bytes;

TEST_CASE("ZlibTransform", "[archive][transform]") {
    ZlibTransform zlib;
    REQUIRE(zlib.level() == ZlibTransform::kDefaultLevel);

    SECTION("compressible data shrinks and decodes") {
        const auto input = repeated_bytes(64 * 1024);
        std::vector<std::uint8_t> encoded;
        REQUIRE(zlib.encode(input, encoded, nullptr));
        REQUIRE(encoded.size() < input.size());

        std::vector<std::uint8_t> decoded;
        std::string error;
        REQUIRE(zlib.decode(encoded, input.size(), decoded, &error));
        REQUIRE(decoded == input);
    }

    SECTION("incompressible data still decodes") {
        const auto input = noise_bytes(5000);
        std::vector<std::uint8_t> encoded;
        REQUIRE(zlib.encode(input, encoded, nullptr));

        std::vector<std::uint8_t> decoded;
        REQUIRE(zlib.decode(encoded, input.size(), decoded, nullptr));
        REQUIRE(decoded == input);
    }

    SECTION("wrong original length fails") {
        const auto input = repeated_bytes(1000);
        std::vector<std::uint8_t> encoded;
        REQUIRE(zlib.encode(input, encoded, nullptr));

        std::vector<std::uint8_t> decoded;
        std::string error;
        REQUIRE_FALSE(zlib.decode(encoded, 999, decoded, &error));
        REQUIRE_FALSE(error.empty());
        REQUIRE_FALSE(zlib.decode(encoded, 1001, decoded, nullptr));
    }

    SECTION("garbage fails") {
        const auto garbage = noise_bytes(64, 7);
        std::vector<std::uint8_t> decoded;
        std::string error;
        REQUIRE_FALSE(zlib.decode(garbage, 100, decoded, &error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("implausible expansion is rejected before allocating") {
        const auto tiny = noise_bytes(4, 3);
        std::vector<std::uint8_t> decoded;
        REQUIRE_FALSE(zlib.decode(tiny, 1ULL << 40, decoded, nullptr));
        REQUIRE(decoded.empty());
    }
}

TEST_CASE("ZlibTransform clamps the level", "[archive][transform]") {
    REQUIRE(ZlibTransform(-3).level() == 0);
    REQUIRE(ZlibTransform(42).level() == 9);
    REQUIRE(make_default_transform(1) != nullptr);
}

TEST_CASE("IdentityTransform", "[archive][transform]") {
    IdentityTransform identity;
    const auto input = noise_bytes(100);

    std::vector<std::uint8_t> encoded;
    REQUIRE(identity.encode(input, encoded, nullptr));
    REQUIRE(encoded == input);

    std::vector<std::uint8_t> decoded;
    REQUIRE(identity.decode(encoded, 100, decoded, nullptr));
    REQUIRE(decoded == input);
    REQUIRE_FALSE(identity.decode(encoded, 99, decoded, nullptr));
}
