/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "keylightkit/core/expected.hpp"
#include "keylightkit/core/json.hpp"
#include "keylightkit/core/types/bounded_int.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace klk::keylight {

/// The path of the lights resource, relative to the base url of a device.
constexpr auto k_lights_path = "elgato/lights";

/// Encoded as a number in JSON.
enum class PowerStatus : uint8_t {
    off = 0,
    on = 1,
};

/**
 * @return The opposite power status.
 */
[[nodiscard]] PowerStatus toggled(PowerStatus status);

const char* to_string(PowerStatus status);

/**
 * The state of a single light.
 */
struct LightStatus {
    /// Named "on" in JSON.
    PowerStatus power {PowerStatus::off};
    Brightness brightness;
    Temperature temperature;

    bool operator==(const LightStatus& other) const;
    bool operator!=(const LightStatus& other) const;
};

/**
 * The state of a device, as returned by GET elgato/lights and accepted by PUT elgato/lights.
 */
struct DeviceStatus {
    /// Named "numberOfLights" in JSON.
    size_t number_of_lights {};
    std::vector<LightStatus> lights;

    /**
     * Updates the light at given index.
     * @param index The index of the light.
     * @param update Called with the light to update.
     * @return An error message if there is no light at given index.
     */
    tl::expected<void, std::string> set(size_t index, const std::function<void(LightStatus&)>& update);

    /**
     * @return The status encoded as JSON.
     */
    [[nodiscard]] std::string to_json() const;

    bool operator==(const DeviceStatus& other) const;
    bool operator!=(const DeviceStatus& other) const;
};

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const PowerStatus& status);
PowerStatus tag_invoke(const boost::json::value_to_tag<PowerStatus>&, const boost::json::value& jv);

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const LightStatus& status);
LightStatus tag_invoke(const boost::json::value_to_tag<LightStatus>&, const boost::json::value& jv);

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const DeviceStatus& status);
DeviceStatus tag_invoke(const boost::json::value_to_tag<DeviceStatus>&, const boost::json::value& jv);

}  // namespace klk::keylight
