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

#include "mdns_decode_error.hpp"

#include "keylightkit/core/expected.hpp"

#include <boost/asio/ip/address.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace klk::mdns {

/// The field separator of the parsable avahi-browse output.
constexpr char k_field_separator = ';';

/**
 * The kind of announcement, taken from the first character of a line.
 */
enum class AnnouncementMode {
    /// '+': a service instance appeared.
    new_service,
    /// '=': a service instance was resolved to an address and port.
    resolved,
    /// '-': a service instance disappeared.
    exited,
};

/**
 * The address family of the interface an announcement was received on.
 */
enum class AddressFamily { ipv4, ipv6 };

/**
 * Fields present in every announcement.
 */
struct AnnouncementBase {
    /// The interface the announcement was received on (i.e. enp6s0).
    std::string interface_name;

    /// The address family of the announcement.
    AddressFamily address_family {AddressFamily::ipv4};

    /// The service instance name with escape sequences decoded (i.e. "Elgato Key Light 8D7C").
    std::string hostname;

    /// The type of the service (i.e. _elg._tcp).
    std::string service_type;

    /// The domain of the service (i.e. local).
    std::string domain;

    bool operator==(const AnnouncementBase& other) const;
    bool operator!=(const AnnouncementBase& other) const;
};

/**
 * Address information of a resolved service instance.
 */
struct ServiceRecord {
    /// The name of the service, equal to the service type of the announcement.
    std::string name;

    /// The mDNS hostname of the host serving the instance (i.e. elgato-key-light-8d7c.local).
    std::string hostname;

    /// The address serving the instance.
    boost::asio::ip::address address;

    /// The port the instance listens on.
    uint16_t port {};

    /// Remaining fields, verbatim. Usually a single field holding the quoted TXT record entries.
    std::vector<std::string> attributes;

    bool operator==(const ServiceRecord& other) const;
    bool operator!=(const ServiceRecord& other) const;
};

/**
 * A service instance appeared. Usually followed by a Resolved announcement for the same instance.
 */
struct NewAnnouncement {
    AnnouncementBase base;

    bool operator==(const NewAnnouncement& other) const;
};

/**
 * A service instance was resolved.
 */
struct ResolvedAnnouncement {
    AnnouncementBase base;
    ServiceRecord service;

    bool operator==(const ResolvedAnnouncement& other) const;
};

/**
 * A service instance disappeared.
 */
struct ExitedAnnouncement {
    AnnouncementBase base;

    bool operator==(const ExitedAnnouncement& other) const;
};

/**
 * One decoded line of avahi-browse output.
 */
using Announcement = std::variant<NewAnnouncement, ResolvedAnnouncement, ExitedAnnouncement>;

/**
 * Parses the mode character of a line.
 * @param c The first character of the line.
 * @return The mode, or an invalid_mode error.
 */
[[nodiscard]] tl::expected<AnnouncementMode, DecodeError> parse_announcement_mode(char c);

/**
 * Parses an address family token.
 * @param token Either "IPv4" or "IPv6".
 * @return The address family, or an invalid_address_family error.
 */
[[nodiscard]] tl::expected<AddressFamily, DecodeError> parse_address_family(std::string_view token);

/**
 * Decodes one line of `avahi-browse --parsable` output.
 * @param line The line, without line terminator.
 * @return The announcement, or a description of the first problem found in the line.
 */
[[nodiscard]] tl::expected<Announcement, DecodeError> decode_announcement(std::string_view line);

/**
 * @return The mode of given announcement.
 */
[[nodiscard]] AnnouncementMode get_mode(const Announcement& announcement);

/**
 * @return The base fields of given announcement.
 */
[[nodiscard]] const AnnouncementBase& get_base(const Announcement& announcement);

[[nodiscard]] const char* to_string(AnnouncementMode mode);
[[nodiscard]] const char* to_string(AddressFamily family);

/**
 * @return A single line description of given announcement, for logging.
 */
[[nodiscard]] std::string to_string(const Announcement& announcement);

}  // namespace klk::mdns
