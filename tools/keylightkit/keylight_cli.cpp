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
#include "keylightkit/core/types/bounded_int.hpp"
#include "keylightkit/keylight/keylight_client.hpp"
#include "keylightkit/keylight/keylight_status.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <functional>
#include <optional>
#include <string>

namespace {

/// The step of the incr/decr commands, in percent of the range.
constexpr int k_step_percent = 10;

/// Only the first light of a device is controlled.
constexpr size_t k_light_index = 0;

int update(const boost::urls::url& base_url, const std::function<void(klk::keylight::LightStatus&)>& fn) {
    auto status = klk::keylight::update_status(base_url, k_light_index, fn);
    if (!status) {
        KLK_ERROR("{}", status.error());
        return 1;
    }
    fmt::println("{}", status->to_json());
    return 0;
}

}  // namespace

int main(int const argc, char* argv[]) {
    klk::set_log_level_from_env();

    CLI::App app {"Controls an Elgato Key Light over its HTTP API"};
    argv = app.ensure_utf8(argv);

    std::string host;
    app.add_option("--host", host, "The address of the light")->required();

    std::string port;
    app.add_option("--port", port, "The port of the HTTP API of the light")->required();

    app.require_subcommand(1);
    const auto status_cmd = app.add_subcommand("status", "Print the status: on/off, brightness, temperature");
    const auto on_cmd = app.add_subcommand("on", "Turn on");
    const auto off_cmd = app.add_subcommand("off", "Turn off");
    const auto toggle_cmd = app.add_subcommand("toggle", "Toggle on/off");
    const auto incr_brightness_cmd = app.add_subcommand("incr-brightness", "Increase brightness by 10%");
    const auto decr_brightness_cmd = app.add_subcommand("decr-brightness", "Decrease brightness by 10%");
    const auto incr_temperature_cmd = app.add_subcommand("incr-temperature", "Increase temperature by 10%");
    const auto decr_temperature_cmd = app.add_subcommand("decr-temperature", "Decrease temperature by 10%");

    const auto set_cmd = app.add_subcommand("set", "Set brightness and/or temperature");
    std::optional<std::string> brightness_arg;
    std::optional<std::string> temperature_arg;
    set_cmd->add_option("-b,--brightness", brightness_arg, "Brightness [0, 100]");
    set_cmd->add_option("-t,--temperature", temperature_arg, "Temperature [143, 344]");
    set_cmd->require_option(1, 2);

    CLI11_PARSE(app, argc, argv);

    const auto base_url = klk::keylight::KeyLightClient::make_base_url(host, port);
    if (!base_url) {
        KLK_ERROR("{}", base_url.error());
        return 1;
    }

    using klk::keylight::LightStatus;

    if (status_cmd->parsed()) {
        const auto status = klk::keylight::get_status(*base_url);
        if (!status) {
            KLK_ERROR("{}", status.error());
            return 1;
        }
        fmt::println("{}", status->to_json());
        return 0;
    }

    if (on_cmd->parsed()) {
        return update(*base_url, [](LightStatus& light) {
            light.power = klk::keylight::PowerStatus::on;
        });
    }

    if (off_cmd->parsed()) {
        return update(*base_url, [](LightStatus& light) {
            light.power = klk::keylight::PowerStatus::off;
        });
    }

    if (toggle_cmd->parsed()) {
        return update(*base_url, [](LightStatus& light) {
            light.power = klk::keylight::toggled(light.power);
        });
    }

    if (incr_brightness_cmd->parsed() || decr_brightness_cmd->parsed()) {
        const auto percent = incr_brightness_cmd->parsed() ? k_step_percent : -k_step_percent;
        return update(*base_url, [percent](LightStatus& light) {
            light.brightness = light.brightness.adjusted_by_percent(percent);
        });
    }

    if (incr_temperature_cmd->parsed() || decr_temperature_cmd->parsed()) {
        const auto percent = incr_temperature_cmd->parsed() ? k_step_percent : -k_step_percent;
        return update(*base_url, [percent](LightStatus& light) {
            light.temperature = light.temperature.adjusted_by_percent(percent);
        });
    }

    if (set_cmd->parsed()) {
        std::optional<klk::Brightness> brightness;
        if (brightness_arg) {
            auto value = klk::Brightness::from_string(*brightness_arg);
            if (!value) {
                KLK_ERROR("Invalid brightness: {}", value.error());
                return 1;
            }
            brightness = *value;
        }

        std::optional<klk::Temperature> temperature;
        if (temperature_arg) {
            auto value = klk::Temperature::from_string(*temperature_arg);
            if (!value) {
                KLK_ERROR("Invalid temperature: {}", value.error());
                return 1;
            }
            temperature = *value;
        }

        return update(*base_url, [brightness, temperature](LightStatus& light) {
            light.brightness = brightness.value_or(light.brightness);
            light.temperature = temperature.value_or(light.temperature);
        });
    }

    return 0;
}
