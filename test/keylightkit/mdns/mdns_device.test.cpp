/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/mdns/mdns_device.hpp"

#include <catch2/catch_all.hpp>

namespace {

klk::mdns::ResolvedAnnouncement make_resolved(const std::string& name, const boost::asio::ip::address& address) {
    klk::mdns::ResolvedAnnouncement announcement;
    announcement.base.interface_name = "enp6s0";
    announcement.base.address_family =
        address.is_v6() ? klk::mdns::AddressFamily::ipv6 : klk::mdns::AddressFamily::ipv4;
    announcement.base.hostname = name;
    announcement.base.service_type = "_elg._tcp";
    announcement.base.domain = "local";
    announcement.service.name = "_elg._tcp";
    announcement.service.hostname = "elgato-key-light-8d7c.local";
    announcement.service.address = address;
    announcement.service.port = 9123;
    return announcement;
}

}  // namespace

TEST_CASE("klk::mdns::make_device_url") {
    SECTION("IPv4") {
        const auto url = klk::mdns::make_device_url(boost::asio::ip::make_address("192.168.0.92"), 9123);
        REQUIRE(url);
        REQUIRE(url->buffer() == "http://192.168.0.92:9123/");
        REQUIRE(url->host() == "192.168.0.92");
        REQUIRE(url->port_number() == 9123);
    }

    SECTION("IPv6 addresses are bracketed") {
        const auto url = klk::mdns::make_device_url(boost::asio::ip::make_address("fe80::3e6a:9dff:fe21:b16e"), 9123);
        REQUIRE(url);
        REQUIRE(url->buffer() == "http://[fe80::3e6a:9dff:fe21:b16e]:9123/");
        REQUIRE(url->host_type() == boost::urls::host_type::ipv6);
    }

    SECTION("IPv6 addresses with a zone id are rejected") {
        auto address = boost::asio::ip::make_address_v6("fe80::3e6a:9dff:fe21:b16e");
        address.scope_id(2);
        REQUIRE_FALSE(klk::mdns::make_device_url(address, 9123));
    }
}

TEST_CASE("klk::mdns::resolve_device") {
    SECTION("Resolved announcement") {
        const klk::mdns::Announcement announcement =
            make_resolved("Elgato Key Light 8D7C", boost::asio::ip::make_address("192.168.0.92"));
        const auto device = klk::mdns::resolve_device(announcement);
        REQUIRE(device);
        REQUIRE(device->has_value());
        REQUIRE(device->value().name == "Elgato Key Light 8D7C");
        REQUIRE(device->value().url.buffer() == "http://192.168.0.92:9123/");
        REQUIRE(device->value().to_string() == "Elgato Key Light 8D7C => http://192.168.0.92:9123/");
    }

    SECTION("New and Exited announcements don't produce a device") {
        klk::mdns::AnnouncementBase base;
        base.hostname = "Elgato Key Light 8D7C";

        const auto from_new = klk::mdns::resolve_device(klk::mdns::NewAnnouncement {base});
        REQUIRE(from_new);
        REQUIRE_FALSE(from_new->has_value());

        const auto from_exited = klk::mdns::resolve_device(klk::mdns::ExitedAnnouncement {base});
        REQUIRE(from_exited);
        REQUIRE_FALSE(from_exited->has_value());
    }

    SECTION("Address with a zone id") {
        auto address = boost::asio::ip::make_address_v6("fe80::1");
        address.scope_id(3);
        const auto device = klk::mdns::resolve_device(make_resolved("Key Light", boost::asio::ip::address(address)));
        REQUIRE_FALSE(device);
        REQUIRE_THAT(device.error(), Catch::Matchers::ContainsSubstring("Key Light"));
    }
}

TEST_CASE("klk::mdns::Device") {
    SECTION("Devices compare by name") {
        const auto url1 = klk::mdns::make_device_url(boost::asio::ip::make_address("192.168.0.92"), 9123);
        const auto url2 = klk::mdns::make_device_url(boost::asio::ip::make_address("192.168.0.93"), 9124);
        REQUIRE(url1);
        REQUIRE(url2);

        const klk::mdns::Device a {"Key Light", *url1};
        const klk::mdns::Device b {"Key Light", *url2};
        const klk::mdns::Device c {"Key Light Air", *url1};

        REQUIRE(a == b);
        REQUIRE(a != c);
    }
}
