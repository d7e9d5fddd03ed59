/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/core/types/bounded_int.hpp"

#include "keylightkit/core/json.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("klk::BoundedInt") {
    using Small = klk::BoundedInt<uint8_t, 5, 10>;

    SECTION("Default value is the lower bound") {
        REQUIRE(Small().value() == 5);
        REQUIRE(klk::Temperature().value() == 143);
    }

    SECTION("Create within range") {
        REQUIRE(Small::create(5).has_value());
        REQUIRE(Small::create(6)->value() == 6);
        REQUIRE(Small::create(10).has_value());
    }

    SECTION("Create outside range") {
        REQUIRE_FALSE(Small::create(3).has_value());
        REQUIRE_FALSE(Small::create(11).has_value());
        REQUIRE_FALSE(Small::create(-1).has_value());
        REQUIRE_FALSE(Small::create(261).has_value());  // Would wrap to 5 when narrowed to uint8_t
        REQUIRE(Small::create(3).error() == "3 is outside range [5, 10]");
    }

    SECTION("From string") {
        REQUIRE(klk::Brightness::from_string("42")->value() == 42);
        REQUIRE(klk::Temperature::from_string("344")->value() == 344);
        REQUIRE_FALSE(klk::Brightness::from_string("101").has_value());
        REQUIRE_FALSE(klk::Brightness::from_string("-1").has_value());
        REQUIRE_FALSE(klk::Brightness::from_string("").has_value());
        REQUIRE_FALSE(klk::Brightness::from_string("50%").has_value());
        REQUIRE(klk::Brightness::from_string("bright").error() == "\"bright\" is not a number");
    }

    SECTION("Adjust by percent") {
        const auto brightness = klk::Brightness::create(50).value();
        REQUIRE(brightness.adjusted_by_percent(10).value() == 60);
        REQUIRE(brightness.adjusted_by_percent(-10).value() == 40);
        REQUIRE(brightness.adjusted_by_percent(0) == brightness);

        // The step of the temperature is 10% of [143, 344], rounded towards zero.
        const auto temperature = klk::Temperature::create(200).value();
        REQUIRE(temperature.adjusted_by_percent(10).value() == 220);
        REQUIRE(temperature.adjusted_by_percent(-10).value() == 180);
    }

    SECTION("Adjust stops at the bounds") {
        REQUIRE(klk::Brightness::create(95)->adjusted_by_percent(10).value() == 100);
        REQUIRE(klk::Brightness::create(3)->adjusted_by_percent(-10).value() == 0);
        REQUIRE(klk::Temperature::create(340)->adjusted_by_percent(10).value() == 344);
        REQUIRE(klk::Temperature::create(150)->adjusted_by_percent(-10).value() == 143);
    }

    SECTION("Comparison") {
        REQUIRE(klk::Brightness::create(3).value() == klk::Brightness::create(3).value());
        REQUIRE(klk::Brightness::create(3).value() != klk::Brightness::create(4).value());
    }

    SECTION("To json") {
        const auto temperature = klk::Temperature::create(191).value();
        REQUIRE(boost::json::value_from(temperature).to_number<int>() == 191);
    }

    SECTION("From json") {
        const auto temperature = klk::parse_json<klk::Temperature>("191");
        REQUIRE(temperature.has_value());
        REQUIRE(temperature->value() == 191);
    }

    SECTION("From json outside range") {
        REQUIRE(klk::parse_json<klk::Temperature>("360").has_error());
        REQUIRE(klk::parse_json<klk::Brightness>("-1").has_error());
        REQUIRE(klk::parse_json<klk::Brightness>("\"50\"").has_error());
    }
}
