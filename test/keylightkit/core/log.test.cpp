/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/core/log.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("klk::parse_log_level") {
    REQUIRE(klk::parse_log_level("TRACE") == klk::LogLevel::trace);
    REQUIRE(klk::parse_log_level("debug") == klk::LogLevel::debug);
    REQUIRE(klk::parse_log_level("Warn") == klk::LogLevel::warning);
    REQUIRE(klk::parse_log_level("OFF") == klk::LogLevel::off);
    REQUIRE_FALSE(klk::parse_log_level("WARNING").has_value());
    REQUIRE_FALSE(klk::parse_log_level("").has_value());
}
