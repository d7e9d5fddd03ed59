/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/core/string.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("string | string_to_int") {
    SECTION("Valid numbers") {
        REQUIRE(klk::string_to_int<uint16_t>("9123") == 9123);
        REQUIRE(klk::string_to_int<uint16_t>("65535") == 65535);
        REQUIRE(klk::string_to_int<int64_t>("-1") == -1);
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(klk::string_to_int<uint16_t>("65536").has_value());
        REQUIRE_FALSE(klk::string_to_int<uint16_t>("-1").has_value());
    }

    SECTION("Not a number") {
        REQUIRE_FALSE(klk::string_to_int<uint16_t>("").has_value());
        REQUIRE_FALSE(klk::string_to_int<uint16_t>("port").has_value());
    }

    SECTION("Strict") {
        REQUIRE(klk::string_to_int<uint16_t>("80abc") == 80);
        REQUIRE_FALSE(klk::string_to_int<uint16_t>("80abc", true).has_value());
        REQUIRE_FALSE(klk::string_to_int<uint16_t>("80 ", true).has_value());
    }
}

TEST_CASE("string | string_compare_case_insensitive") {
    REQUIRE(klk::string_compare_case_insensitive("IPv4", "ipv4"));
    REQUIRE(klk::string_compare_case_insensitive("", ""));
    REQUIRE_FALSE(klk::string_compare_case_insensitive("IPv4", "IPv6"));
    REQUIRE_FALSE(klk::string_compare_case_insensitive("IPv4", "IPv4 "));
}
