/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/mdns/mdns_device_registry.hpp"

#include <catch2/catch_all.hpp>

namespace {

using Change = klk::mdns::DeviceRegistry::Change;

klk::mdns::Announcement resolved(const std::string& name, const std::string& address, const uint16_t port = 9123) {
    klk::mdns::ResolvedAnnouncement announcement;
    announcement.base.interface_name = "enp6s0";
    announcement.base.hostname = name;
    announcement.base.service_type = "_elg._tcp";
    announcement.base.domain = "local";
    announcement.service.name = "_elg._tcp";
    announcement.service.address = boost::asio::ip::make_address(address);
    announcement.service.port = port;
    return announcement;
}

klk::mdns::Announcement exited(const std::string& name) {
    klk::mdns::ExitedAnnouncement announcement;
    announcement.base.interface_name = "enp6s0";
    announcement.base.hostname = name;
    announcement.base.service_type = "_elg._tcp";
    announcement.base.domain = "local";
    return announcement;
}

klk::mdns::Device device(const std::string& name, const std::string& url) {
    return {name, boost::urls::url(url)};
}

}  // namespace

TEST_CASE("klk::mdns::DeviceRegistry") {
    SECTION("Default constructed registry is empty") {
        const klk::mdns::DeviceRegistry registry;
        REQUIRE(registry.empty());
        REQUIRE(registry.size() == 0);
        REQUIRE(registry.find("Key Light") == nullptr);
    }

    SECTION("New announcements are ignored") {
        klk::mdns::DeviceRegistry registry;
        klk::mdns::NewAnnouncement announcement;
        announcement.base.hostname = "Key Light";
        REQUIRE(registry.apply(announcement) == Change::ignored);
        REQUIRE(registry.empty());
    }

    SECTION("Resolved announcements add a device") {
        klk::mdns::DeviceRegistry registry;
        REQUIRE(registry.apply(resolved("Key Light", "192.168.0.92")) == Change::added);
        REQUIRE(registry.size() == 1);

        const auto* found = registry.find("Key Light");
        REQUIRE(found != nullptr);
        REQUIRE(found->url.buffer() == "http://192.168.0.92:9123/");
    }

    SECTION("Adding the same device twice is a no-op") {
        klk::mdns::DeviceRegistry registry;
        REQUIRE(registry.apply(resolved("Key Light", "192.168.0.92")) == Change::added);

        // Same instance resolved on another interface or address family.
        REQUIRE(registry.apply(resolved("Key Light", "fe80::1")) == Change::duplicate);
        REQUIRE(registry.size() == 1);

        // First seen url is kept.
        REQUIRE(registry.find("Key Light")->url.buffer() == "http://192.168.0.92:9123/");
    }

    SECTION("Exited removes only the device with that name") {
        klk::mdns::DeviceRegistry registry;
        REQUIRE(registry.apply(resolved("Key Light A", "192.168.0.92")) == Change::added);
        REQUIRE(registry.apply(resolved("Key Light B", "192.168.0.93")) == Change::added);
        REQUIRE(registry.apply(resolved("Key Light C", "192.168.0.94")) == Change::added);

        REQUIRE(registry.apply(exited("Key Light B")) == Change::removed);
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.find("Key Light A") != nullptr);
        REQUIRE(registry.find("Key Light B") == nullptr);
        REQUIRE(registry.find("Key Light C") != nullptr);

        // Order of the remaining devices is kept.
        REQUIRE(registry.get_devices().at(0).name == "Key Light A");
        REQUIRE(registry.get_devices().at(1).name == "Key Light C");
    }

    SECTION("Exited for an unknown device leaves the registry alone") {
        klk::mdns::DeviceRegistry registry;
        REQUIRE(registry.apply(resolved("Key Light A", "192.168.0.92")) == Change::added);
        REQUIRE(registry.apply(exited("Key Light B")) == Change::not_found);
        REQUIRE(registry.size() == 1);
        REQUIRE(registry.find("Key Light A") != nullptr);
    }

    SECTION("Device can come back after it exited") {
        klk::mdns::DeviceRegistry registry;
        REQUIRE(registry.apply(resolved("Key Light", "192.168.0.92")) == Change::added);
        REQUIRE(registry.apply(exited("Key Light")) == Change::removed);
        REQUIRE(registry.empty());
        REQUIRE(registry.apply(resolved("Key Light", "192.168.0.95")) == Change::added);
        REQUIRE(registry.find("Key Light")->url.buffer() == "http://192.168.0.95:9123/");
    }

    SECTION("Unresolvable announcements leave the registry alone") {
        klk::mdns::DeviceRegistry registry;
        auto announcement = resolved("Key Light", "fe80::1");
        auto address = boost::asio::ip::make_address_v6("fe80::1");
        address.scope_id(2);
        std::get<klk::mdns::ResolvedAnnouncement>(announcement).service.address = address;

        REQUIRE(registry.apply(announcement) == Change::unresolvable);
        REQUIRE(registry.empty());
    }

    SECTION("Seeded registry drops duplicates") {
        const std::vector<klk::mdns::Device> seed {
            device("Key Light A", "http://192.168.0.92:9123/"),
            device("Key Light B", "http://192.168.0.93:9123/"),
            device("Key Light A", "http://192.168.0.94:9123/"),
        };
        const klk::mdns::DeviceRegistry registry(seed);
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.find("Key Light A")->url.buffer() == "http://192.168.0.92:9123/");
    }

    SECTION("Add and remove directly") {
        klk::mdns::DeviceRegistry registry;
        REQUIRE(registry.add(device("Key Light", "http://192.168.0.92:9123/")));
        REQUIRE_FALSE(registry.add(device("Key Light", "http://192.168.0.93:9123/")));
        REQUIRE(registry.remove("Key Light"));
        REQUIRE_FALSE(registry.remove("Key Light"));
        REQUIRE(registry.empty());
    }
}

TEST_CASE("klk::mdns::DeviceRegistry::Change") {
    REQUIRE(std::string(klk::mdns::to_string(Change::added)) == "added");
    REQUIRE(std::string(klk::mdns::to_string(Change::not_found)) == "not_found");
    REQUIRE(fmt::format("{}", Change::removed) == "removed");
}
