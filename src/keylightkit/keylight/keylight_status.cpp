/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/keylight/keylight_status.hpp"

#include <fmt/format.h>

#include <stdexcept>

klk::keylight::PowerStatus klk::keylight::toggled(const PowerStatus status) {
    return status == PowerStatus::on ? PowerStatus::off : PowerStatus::on;
}

const char* klk::keylight::to_string(const PowerStatus status) {
    switch (status) {
        case PowerStatus::off:
            return "off";
        case PowerStatus::on:
            return "on";
    }
    return "undefined";
}

bool klk::keylight::LightStatus::operator==(const LightStatus& other) const {
    return power == other.power && brightness == other.brightness && temperature == other.temperature;
}

bool klk::keylight::LightStatus::operator!=(const LightStatus& other) const {
    return !(*this == other);
}

tl::expected<void, std::string>
klk::keylight::DeviceStatus::set(const size_t index, const std::function<void(LightStatus&)>& update) {
    if (index >= number_of_lights || index >= lights.size()) {
        return tl::unexpected(fmt::format("Invalid index {} (number of lights: {})", index, lights.size()));
    }
    update(lights[index]);
    return {};
}

std::string klk::keylight::DeviceStatus::to_json() const {
    return boost::json::serialize(boost::json::value_from(*this));
}

bool klk::keylight::DeviceStatus::operator==(const DeviceStatus& other) const {
    return number_of_lights == other.number_of_lights && lights == other.lights;
}

bool klk::keylight::DeviceStatus::operator!=(const DeviceStatus& other) const {
    return !(*this == other);
}

void klk::keylight::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const PowerStatus& status) {
    jv = static_cast<uint8_t>(status);
}

klk::keylight::PowerStatus
klk::keylight::tag_invoke(const boost::json::value_to_tag<PowerStatus>&, const boost::json::value& jv) {
    const auto value = jv.to_number<int64_t>();
    if (value == 0) {
        return PowerStatus::off;
    }
    if (value == 1) {
        return PowerStatus::on;
    }
    throw std::out_of_range(fmt::format("Invalid power status: {}", value));
}

void klk::keylight::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const LightStatus& status) {
    jv = {
        {"on", boost::json::value_from(status.power)},
        {"brightness", boost::json::value_from(status.brightness)},
        {"temperature", boost::json::value_from(status.temperature)},
    };
}

klk::keylight::LightStatus
klk::keylight::tag_invoke(const boost::json::value_to_tag<LightStatus>&, const boost::json::value& jv) {
    LightStatus status;
    status.power = boost::json::value_to<PowerStatus>(jv.at("on"));
    status.brightness = boost::json::value_to<Brightness>(jv.at("brightness"));
    status.temperature = boost::json::value_to<Temperature>(jv.at("temperature"));
    return status;
}

void klk::keylight::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const DeviceStatus& status) {
    jv = {
        {"numberOfLights", status.number_of_lights},
        {"lights", boost::json::value_from(status.lights)},
    };
}

klk::keylight::DeviceStatus
klk::keylight::tag_invoke(const boost::json::value_to_tag<DeviceStatus>&, const boost::json::value& jv) {
    DeviceStatus status;
    status.number_of_lights = jv.at("numberOfLights").to_number<size_t>();
    status.lights = boost::json::value_to<std::vector<LightStatus>>(jv.at("lights"));
    return status;
}
