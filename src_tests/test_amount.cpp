/**
 * @file test_amount.cpp
 * @brief Tests for base-unit amounts, addresses, ABI words and tolerance bands
 *
 * Covers:
 * - Decimal and hex parsing of 256-bit quantities, including overflow rejection
 * - Whole-unit parsing and formatting with a fixed number of decimals
 * - Canonical address parsing and ABI word extraction from calldata
 * - Relative and absolute tolerance bands with inclusive boundaries
 *
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch_test_macros.hpp>

#include "quest_bench/primitives.hpp"
#include "quest_bench/tolerance.hpp"

#include <string>

using namespace quest::bench;

TEST_CASE("parse_wei accepts decimal and hex quantities", "[amount]") {
    REQUIRE(parse_wei("0") == Wei{0});
    REQUIRE(parse_wei("1000000000000000000") == pow10(18));
    REQUIRE(parse_wei("0x10") == Wei{16});
    REQUIRE(parse_wei("0xDE0B6B3A7640000") == pow10(18));

    REQUIRE_FALSE(parse_wei("").has_value());
    REQUIRE_FALSE(parse_wei("0x").has_value());
    REQUIRE_FALSE(parse_wei("-1").has_value());
    REQUIRE_FALSE(parse_wei("1.5").has_value());
    REQUIRE_FALSE(parse_wei("12a").has_value());
}

TEST_CASE("parse_wei rejects values wider than 256 bits", "[amount]") {
    const std::string max_dec = to_decimal(~Wei{0});
    REQUIRE(parse_wei(max_dec) == ~Wei{0});
    REQUIRE_FALSE(parse_wei(max_dec + "0").has_value());
    REQUIRE_FALSE(parse_wei("0x1" + std::string(64, '0')).has_value());
}

TEST_CASE("parse_units scales whole-unit amounts", "[amount]") {
    REQUIRE(parse_units("1", 18) == pow10(18));
    REQUIRE(parse_units("0.05", 18) == Wei{50'000'000'000'000'000ULL});
    REQUIRE(parse_units(".5", 6) == Wei{500'000});
    REQUIRE(parse_units("12.", 2) == Wei{1200});

    SECTION("more fractional digits than the unit allows is rejected") {
        REQUIRE_FALSE(parse_units("0.0001", 3).has_value());
    }
    SECTION("garbage is rejected") {
        REQUIRE_FALSE(parse_units(".", 18).has_value());
        REQUIRE_FALSE(parse_units("0x10", 18).has_value());
        REQUIRE_FALSE(parse_units("1e18", 18).has_value());
    }
}

TEST_CASE("format_units trims trailing zeros", "[amount]") {
    REQUIRE(format_units(Wei{1'500'000'000'000'000'000ULL}, 18) == "1.5");
    REQUIRE(format_units(pow10(18), 18) == "1");
    REQUIRE(format_units(Wei{1}, 18) == "0.000000000000000001");
    REQUIRE(format_units(Wei{42}, 0) == "42");
}

TEST_CASE("quantities use the minimal hex wire form", "[amount]") {
    REQUIRE(to_quantity(Wei{0}) == "0x0");
    REQUIRE(to_quantity(std::uint64_t{255}) == "0xff");
    REQUIRE(to_decimal(pow10(20)) == "100000000000000000000");
}

TEST_CASE("addresses are canonical lowercase hex", "[amount]") {
    const auto a = parse_address("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
    REQUIRE(a.has_value());
    REQUIRE(a->hex == "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
    REQUIRE(a == parse_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"));

    REQUIRE_FALSE(parse_address("7e5f4552091a69125d5dfcb7b8c2659029395bdf").has_value());
    REQUIRE_FALSE(parse_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bd").has_value());
    REQUIRE_FALSE(parse_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bdz").has_value());
}

TEST_CASE("calldata words decode addresses and amounts", "[amount]") {
    const auto to = *parse_address("0x000000000000000000000000000000000000beef");
    const std::string data = "0xA9059CBB" + abi_word(to) + abi_word(Wei{5000});

    REQUIRE(calldata_selector(data) == std::string{"0xa9059cbb"});
    REQUIRE(word_to_address(*calldata_word(data, 0)) == to);
    REQUIRE(word_to_wei(*calldata_word(data, 1)) == Wei{5000});
    REQUIRE_FALSE(calldata_word(data, 2).has_value());
    REQUIRE_FALSE(calldata_selector("0x12").has_value());

    REQUIRE(is_hex_data("0x"));
    REQUIRE(is_hex_data("0xabcd"));
    REQUIRE_FALSE(is_hex_data("0xabc"));
    REQUIRE_FALSE(is_hex_data("abcd"));
}

TEST_CASE("relative tolerance boundaries are inclusive", "[tolerance]") {
    const auto tol = Tolerance::parse_percent("0.1%");
    REQUIRE(tol.has_value());
    REQUIRE(tol->ppm == 1000);
    REQUIRE(tol->describe() == "0.1%");

    const Wei expected = pow10(18);
    const Wei band = pow10(15);
    REQUIRE(tol->band_for(expected) == band);
    REQUIRE(tol->accepts(expected + band, expected));
    REQUIRE(tol->accepts(expected - band, expected));
    REQUIRE_FALSE(tol->accepts(expected + band + Wei{1}, expected));
    REQUIRE_FALSE(tol->accepts(expected - band - Wei{1}, expected));
}

TEST_CASE("absolute tolerance and exact comparison", "[tolerance]") {
    Tolerance tol;
    REQUIRE(tol.describe() == "exact");
    REQUIRE(tol.accepts(Wei{7}, Wei{7}));
    REQUIRE_FALSE(tol.accepts(Wei{8}, Wei{7}));

    tol.absolute = Wei{10};
    REQUIRE(tol.accepts(Wei{110}, Wei{100}));
    REQUIRE_FALSE(tol.accepts(Wei{111}, Wei{100}));

    SECTION("the wider band wins") {
        tol.ppm = 500'000;  // 50%
        REQUIRE(tol.accepts(Wei{150}, Wei{100}));
        REQUIRE(tol.describe() == "50% or 10 base units");
    }
}

TEST_CASE("parse_percent rejects malformed bands", "[tolerance]") {
    REQUIRE_FALSE(Tolerance::parse_percent("0.1").has_value());
    REQUIRE_FALSE(Tolerance::parse_percent("%").has_value());
    REQUIRE_FALSE(Tolerance::parse_percent("101%").has_value());
    REQUIRE_FALSE(Tolerance::parse_percent("0.00001%").has_value());
    REQUIRE(Tolerance::parse_percent("100%")->ppm == 1'000'000);
}
