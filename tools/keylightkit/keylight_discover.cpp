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
#include "keylightkit/mdns/avahi/avahi_daemon.hpp"
#include "keylightkit/mdns/avahi/avahi_discovery.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <iostream>
#include <vector>

namespace {

void print_devices(const std::vector<klk::mdns::Device>& devices) {
    for (const auto& device : devices) {
        fmt::println("{}", device.to_string());
    }
}

}  // namespace

int main(int const argc, char* argv[]) {
    klk::set_log_level_from_env();

    CLI::App app {"Discovers Elgato Key Lights on the local network using avahi-browse"};
    argv = app.ensure_utf8(argv);

    klk::mdns::AvahiBrowse::Config config;
    app.add_option("--executable", config.executable, "The avahi-browse executable")->capture_default_str();
    app.add_option("--service-type", config.service_type, "The service type to browse for")->capture_default_str();
    app.add_option("--domain", config.domain, "The domain to browse in (default: the default domain)");

    bool watch = false;
    app.add_flag("-w,--watch", watch, "Keep watching and print the devices whenever they change");

    CLI11_PARSE(app, argc, argv);

    auto devices = klk::mdns::find_devices(config);
    if (!devices) {
        KLK_ERROR("Discovery failed: {}", devices.error());
        return 1;
    }

    print_devices(*devices);

    if (!watch) {
        return 0;
    }

    klk::mdns::DiscoveryDaemon daemon(config, *devices);
    daemon.on_registry_changed = [&daemon](const klk::mdns::DeviceRegistry::Change change) {
        const auto current = daemon.registry().get_devices();
        if (!current) {
            return;
        }
        fmt::println("-- {} ({} devices)", change, current->size());
        print_devices(*current);
    };

    if (auto result = daemon.start(); !result) {
        KLK_ERROR("Failed to start watching: {}", result.error());
        return 1;
    }

    std::cout << "Press enter to exit..." << std::endl;
    std::cin.get();

    daemon.stop();

    if (auto result = daemon.wait(); !result) {
        KLK_ERROR("Watching ended with an error: {}", result.error());
        return 1;
    }

    return 0;
}
