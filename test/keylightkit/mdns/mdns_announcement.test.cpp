/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/mdns/mdns_announcement.hpp"

#include <catch2/catch_all.hpp>

namespace {

constexpr auto k_new_line = R"(+;enp6s0;IPv6;Elgato\032Key\032Light\0328D7C;_elg._tcp;local)";
constexpr auto k_resolved_line =
    R"(=;enp6s0;IPv4;Elgato\032Key\032Light\0328D7C;_elg._tcp;local;elgato-key-light-8d7c.local;192.168.0.92;9123;)"
    R"("pv=1.0" "md=Elgato Key Light 20GAK9901" "id=3C:6A:9D:21:B1:6E" "dt=53" "mf=Elgato")";
constexpr auto k_exited_line = R"(-;wlp3s0;IPv4;Elgato\032Key\032Light\0328D7C;_elg._tcp;local)";

}  // namespace

TEST_CASE("klk::mdns::parse_announcement_mode") {
    REQUIRE(klk::mdns::parse_announcement_mode('+') == klk::mdns::AnnouncementMode::new_service);
    REQUIRE(klk::mdns::parse_announcement_mode('=') == klk::mdns::AnnouncementMode::resolved);
    REQUIRE(klk::mdns::parse_announcement_mode('-') == klk::mdns::AnnouncementMode::exited);

    const auto invalid = klk::mdns::parse_announcement_mode('x');
    REQUIRE_FALSE(invalid);
    REQUIRE(invalid.error() == klk::mdns::DecodeError {klk::mdns::DecodeError::Kind::invalid_mode, "x"});
}

TEST_CASE("klk::mdns::parse_address_family") {
    REQUIRE(klk::mdns::parse_address_family("IPv4") == klk::mdns::AddressFamily::ipv4);
    REQUIRE(klk::mdns::parse_address_family("IPv6") == klk::mdns::AddressFamily::ipv6);
    REQUIRE_FALSE(klk::mdns::parse_address_family("ipv4"));
    REQUIRE_FALSE(klk::mdns::parse_address_family(""));
}

TEST_CASE("klk::mdns::decode_announcement") {
    SECTION("New") {
        const auto announcement = klk::mdns::decode_announcement(k_new_line);
        REQUIRE(announcement);
        REQUIRE(klk::mdns::get_mode(*announcement) == klk::mdns::AnnouncementMode::new_service);

        const auto* new_announcement = std::get_if<klk::mdns::NewAnnouncement>(&*announcement);
        REQUIRE(new_announcement != nullptr);
        REQUIRE(new_announcement->base.interface_name == "enp6s0");
        REQUIRE(new_announcement->base.address_family == klk::mdns::AddressFamily::ipv6);
        REQUIRE(new_announcement->base.hostname == "Elgato Key Light 8D7C");
        REQUIRE(new_announcement->base.service_type == "_elg._tcp");
        REQUIRE(new_announcement->base.domain == "local");
    }

    SECTION("Resolved") {
        const auto announcement = klk::mdns::decode_announcement(k_resolved_line);
        REQUIRE(announcement);
        REQUIRE(klk::mdns::get_mode(*announcement) == klk::mdns::AnnouncementMode::resolved);

        const auto* resolved = std::get_if<klk::mdns::ResolvedAnnouncement>(&*announcement);
        REQUIRE(resolved != nullptr);
        REQUIRE(resolved->base.interface_name == "enp6s0");
        REQUIRE(resolved->base.address_family == klk::mdns::AddressFamily::ipv4);
        REQUIRE(resolved->base.hostname == "Elgato Key Light 8D7C");
        REQUIRE(resolved->service.name == "_elg._tcp");
        REQUIRE(resolved->service.hostname == "elgato-key-light-8d7c.local");
        REQUIRE(resolved->service.address == boost::asio::ip::make_address("192.168.0.92"));
        REQUIRE(resolved->service.port == 9123);
        REQUIRE(resolved->service.attributes.size() == 1);
        REQUIRE(
            resolved->service.attributes.front()
            == R"("pv=1.0" "md=Elgato Key Light 20GAK9901" "id=3C:6A:9D:21:B1:6E" "dt=53" "mf=Elgato")"
        );
    }

    SECTION("Resolved IPv6") {
        const auto announcement = klk::mdns::decode_announcement(
            R"(=;enp6s0;IPv6;Key\032Light;_elg._tcp;local;key-light.local;fe80::3e6a:9dff:fe21:b16e;9123;"pv=1.0")"
        );
        REQUIRE(announcement);
        const auto* resolved = std::get_if<klk::mdns::ResolvedAnnouncement>(&*announcement);
        REQUIRE(resolved != nullptr);
        REQUIRE(resolved->service.address.is_v6());
        REQUIRE(resolved->service.address.to_string() == "fe80::3e6a:9dff:fe21:b16e");
    }

    SECTION("Resolved without attributes") {
        const auto announcement =
            klk::mdns::decode_announcement("=;lo;IPv4;Light;_elg._tcp;local;light.local;127.0.0.1;9123");
        REQUIRE(announcement);
        const auto* resolved = std::get_if<klk::mdns::ResolvedAnnouncement>(&*announcement);
        REQUIRE(resolved != nullptr);
        REQUIRE(resolved->service.attributes.empty());
    }

    SECTION("Trailing separator yields an empty attribute") {
        const auto announcement =
            klk::mdns::decode_announcement("=;lo;IPv4;Light;_elg._tcp;local;light.local;127.0.0.1;9123;");
        REQUIRE(announcement);
        const auto* resolved = std::get_if<klk::mdns::ResolvedAnnouncement>(&*announcement);
        REQUIRE(resolved != nullptr);
        REQUIRE(resolved->service.attributes == std::vector<std::string> {""});
    }

    SECTION("Multiple attribute fields are kept verbatim") {
        const auto announcement =
            klk::mdns::decode_announcement("=;lo;IPv4;Light;_elg._tcp;local;light.local;127.0.0.1;9123;a;b");
        REQUIRE(announcement);
        const auto* resolved = std::get_if<klk::mdns::ResolvedAnnouncement>(&*announcement);
        REQUIRE(resolved != nullptr);
        REQUIRE(resolved->service.attributes == std::vector<std::string> {"a", "b"});
    }

    SECTION("Exited") {
        const auto announcement = klk::mdns::decode_announcement(k_exited_line);
        REQUIRE(announcement);
        REQUIRE(klk::mdns::get_mode(*announcement) == klk::mdns::AnnouncementMode::exited);
        const auto& base = klk::mdns::get_base(*announcement);
        REQUIRE(base.interface_name == "wlp3s0");
        REQUIRE(base.hostname == "Elgato Key Light 8D7C");
    }

    SECTION("Fields after the domain of an exited announcement are ignored") {
        const auto announcement = klk::mdns::decode_announcement("-;lo;IPv4;Light;_elg._tcp;local;extra");
        REQUIRE(announcement);
        REQUIRE(klk::mdns::get_mode(*announcement) == klk::mdns::AnnouncementMode::exited);
    }

    SECTION("Empty line") {
        const auto announcement = klk::mdns::decode_announcement("");
        REQUIRE_FALSE(announcement);
        REQUIRE(
            announcement.error()
            == klk::mdns::DecodeError {klk::mdns::DecodeError::Kind::not_enough_arguments, "missing mode"}
        );
    }

    SECTION("Unknown mode") {
        const auto announcement = klk::mdns::decode_announcement("*;lo;IPv4;Light;_elg._tcp;local");
        REQUIRE_FALSE(announcement);
        REQUIRE(announcement.error() == klk::mdns::DecodeError {klk::mdns::DecodeError::Kind::invalid_mode, "*"});
    }

    SECTION("Not enough fields") {
        const auto announcement = klk::mdns::decode_announcement("+;lo;IPv4;Light;_elg._tcp");
        REQUIRE_FALSE(announcement);
        REQUIRE(
            announcement.error()
            == klk::mdns::DecodeError {klk::mdns::DecodeError::Kind::not_enough_arguments, "missing domain"}
        );

        const auto only_mode = klk::mdns::decode_announcement("+");
        REQUIRE_FALSE(only_mode);
        REQUIRE(only_mode.error().context == "missing interface");
    }

    SECTION("Resolved without port") {
        const auto announcement =
            klk::mdns::decode_announcement("=;lo;IPv4;Light;_elg._tcp;local;light.local;127.0.0.1");
        REQUIRE_FALSE(announcement);
        REQUIRE(
            announcement.error()
            == klk::mdns::DecodeError {klk::mdns::DecodeError::Kind::not_enough_arguments, "missing port"}
        );
    }

    SECTION("Invalid address family") {
        const auto announcement = klk::mdns::decode_announcement("+;lo;IPv5;Light;_elg._tcp;local");
        REQUIRE_FALSE(announcement);
        REQUIRE(
            announcement.error()
            == klk::mdns::DecodeError {klk::mdns::DecodeError::Kind::invalid_address_family, "IPv5"}
        );
    }

    SECTION("Invalid address") {
        const auto announcement =
            klk::mdns::decode_announcement("=;lo;IPv4;Light;_elg._tcp;local;light.local;light.local;9123");
        REQUIRE_FALSE(announcement);
        REQUIRE(
            announcement.error()
            == klk::mdns::DecodeError {klk::mdns::DecodeError::Kind::invalid_address, "light.local"}
        );
    }

    SECTION("Invalid port") {
        const auto out_of_range =
            klk::mdns::decode_announcement("=;lo;IPv4;Light;_elg._tcp;local;light.local;127.0.0.1;65536");
        REQUIRE_FALSE(out_of_range);
        REQUIRE(
            out_of_range.error() == klk::mdns::DecodeError {klk::mdns::DecodeError::Kind::invalid_port, "65536"}
        );

        const auto not_a_number =
            klk::mdns::decode_announcement("=;lo;IPv4;Light;_elg._tcp;local;light.local;127.0.0.1;http");
        REQUIRE_FALSE(not_a_number);
        REQUIRE(not_a_number.error().kind == klk::mdns::DecodeError::Kind::invalid_port);

        const auto highest =
            klk::mdns::decode_announcement("=;lo;IPv4;Light;_elg._tcp;local;light.local;127.0.0.1;65535");
        REQUIRE(highest);
    }

    SECTION("Invalid escape in the instance name") {
        const auto announcement = klk::mdns::decode_announcement(R"(+;lo;IPv4;Key\999Light;_elg._tcp;local)");
        REQUIRE_FALSE(announcement);
        REQUIRE(announcement.error().kind == klk::mdns::DecodeError::Kind::invalid_escape);
    }
}

TEST_CASE("klk::mdns::to_string(Announcement)") {
    SECTION("New") {
        const auto announcement = klk::mdns::decode_announcement(k_new_line);
        REQUIRE(announcement);
        REQUIRE(
            klk::mdns::to_string(*announcement)
            == R"(new "Elgato Key Light 8D7C" type=_elg._tcp domain=local interface=enp6s0 (IPv6))"
        );
    }

    SECTION("Resolved") {
        const auto announcement = klk::mdns::decode_announcement(k_resolved_line);
        REQUIRE(announcement);
        REQUIRE(
            klk::mdns::to_string(*announcement)
            == R"(resolved "Elgato Key Light 8D7C" type=_elg._tcp domain=local interface=enp6s0 (IPv4) )"
               R"(host=elgato-key-light-8d7c.local address=192.168.0.92 port=9123)"
        );
    }
}

TEST_CASE("klk::mdns::get_mode") {
    klk::mdns::AnnouncementBase base;
    base.hostname = "Elgato Key Light 8D7C";

    REQUIRE(klk::mdns::get_mode(klk::mdns::NewAnnouncement {base}) == klk::mdns::AnnouncementMode::new_service);
    REQUIRE(klk::mdns::get_mode(klk::mdns::ResolvedAnnouncement {base, {}}) == klk::mdns::AnnouncementMode::resolved);
    REQUIRE(klk::mdns::get_mode(klk::mdns::ExitedAnnouncement {base}) == klk::mdns::AnnouncementMode::exited);
}
