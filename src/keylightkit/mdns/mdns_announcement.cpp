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

#include "keylightkit/core/string.hpp"
#include "keylightkit/core/string_parser.hpp"
#include "keylightkit/mdns/mdns_escape.hpp"

#include <fmt/format.h>

namespace {

constexpr auto k_ipv4_token = "IPv4";
constexpr auto k_ipv6_token = "IPv6";

klk::mdns::DecodeError missing_field(const char* field_name) {
    return {klk::mdns::DecodeError::Kind::not_enough_arguments, fmt::format("missing {}", field_name)};
}

/// One overload per alternative, so a new alternative without a mode doesn't compile.
struct ModeVisitor {
    klk::mdns::AnnouncementMode operator()(const klk::mdns::NewAnnouncement&) const {
        return klk::mdns::AnnouncementMode::new_service;
    }

    klk::mdns::AnnouncementMode operator()(const klk::mdns::ResolvedAnnouncement&) const {
        return klk::mdns::AnnouncementMode::resolved;
    }

    klk::mdns::AnnouncementMode operator()(const klk::mdns::ExitedAnnouncement&) const {
        return klk::mdns::AnnouncementMode::exited;
    }
};

}  // namespace

bool klk::mdns::AnnouncementBase::operator==(const AnnouncementBase& other) const {
    return interface_name == other.interface_name && address_family == other.address_family
        && hostname == other.hostname && service_type == other.service_type && domain == other.domain;
}

bool klk::mdns::AnnouncementBase::operator!=(const AnnouncementBase& other) const {
    return !(*this == other);
}

bool klk::mdns::ServiceRecord::operator==(const ServiceRecord& other) const {
    return name == other.name && hostname == other.hostname && address == other.address && port == other.port
        && attributes == other.attributes;
}

bool klk::mdns::ServiceRecord::operator!=(const ServiceRecord& other) const {
    return !(*this == other);
}

bool klk::mdns::NewAnnouncement::operator==(const NewAnnouncement& other) const {
    return base == other.base;
}

bool klk::mdns::ResolvedAnnouncement::operator==(const ResolvedAnnouncement& other) const {
    return base == other.base && service == other.service;
}

bool klk::mdns::ExitedAnnouncement::operator==(const ExitedAnnouncement& other) const {
    return base == other.base;
}

tl::expected<klk::mdns::AnnouncementMode, klk::mdns::DecodeError> klk::mdns::parse_announcement_mode(const char c) {
    switch (c) {
        case '+':
            return AnnouncementMode::new_service;
        case '=':
            return AnnouncementMode::resolved;
        case '-':
            return AnnouncementMode::exited;
        default:
            return tl::unexpected(DecodeError {DecodeError::Kind::invalid_mode, std::string(1, c)});
    }
}

tl::expected<klk::mdns::AddressFamily, klk::mdns::DecodeError>
klk::mdns::parse_address_family(const std::string_view token) {
    if (token == k_ipv4_token) {
        return AddressFamily::ipv4;
    }
    if (token == k_ipv6_token) {
        return AddressFamily::ipv6;
    }
    return tl::unexpected(DecodeError {DecodeError::Kind::invalid_address_family, std::string(token)});
}

tl::expected<klk::mdns::Announcement, klk::mdns::DecodeError>
klk::mdns::decode_announcement(const std::string_view line) {
    StringParser parser(line);

    // Mode
    AnnouncementMode mode {};
    if (const auto field = parser.split(k_field_separator); field && !field->empty()) {
        const auto parsed = parse_announcement_mode(field->front());
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        mode = *parsed;
    } else {
        return tl::unexpected(missing_field("mode"));
    }

    AnnouncementBase base;

    // Interface
    if (const auto field = parser.split(k_field_separator)) {
        base.interface_name = *field;
    } else {
        return tl::unexpected(missing_field("interface"));
    }

    // Address family
    if (const auto field = parser.split(k_field_separator)) {
        const auto family = parse_address_family(*field);
        if (!family) {
            return tl::unexpected(family.error());
        }
        base.address_family = *family;
    } else {
        return tl::unexpected(missing_field("address family"));
    }

    // Instance name
    if (const auto field = parser.split(k_field_separator)) {
        auto hostname = decode_instance_name(*field);
        if (!hostname) {
            return tl::unexpected(hostname.error());
        }
        base.hostname = std::move(*hostname);
    } else {
        return tl::unexpected(missing_field("hostname"));
    }

    // Service type
    if (const auto field = parser.split(k_field_separator)) {
        base.service_type = *field;
    } else {
        return tl::unexpected(missing_field("service type"));
    }

    // Domain
    if (const auto field = parser.split(k_field_separator)) {
        base.domain = *field;
    } else {
        return tl::unexpected(missing_field("domain"));
    }

    if (mode == AnnouncementMode::new_service) {
        return NewAnnouncement {std::move(base)};
    }

    if (mode == AnnouncementMode::exited) {
        return ExitedAnnouncement {std::move(base)};
    }

    ServiceRecord service;
    service.name = base.service_type;

    // Host name
    if (const auto field = parser.split(k_field_separator)) {
        service.hostname = *field;
    } else {
        return tl::unexpected(missing_field("resolved hostname"));
    }

    // Address
    if (const auto field = parser.split(k_field_separator)) {
        boost::system::error_code ec;
        service.address = boost::asio::ip::make_address(std::string(*field), ec);
        if (ec) {
            return tl::unexpected(DecodeError {DecodeError::Kind::invalid_address, std::string(*field)});
        }
    } else {
        return tl::unexpected(missing_field("address"));
    }

    // Port
    if (const auto field = parser.split(k_field_separator)) {
        const auto port = string_to_int<uint16_t>(*field, true);
        if (!port) {
            return tl::unexpected(DecodeError {DecodeError::Kind::invalid_port, std::string(*field)});
        }
        service.port = *port;
    } else {
        return tl::unexpected(missing_field("port"));
    }

    // Attributes
    while (const auto field = parser.split(k_field_separator)) {
        service.attributes.emplace_back(*field);
    }

    return ResolvedAnnouncement {std::move(base), std::move(service)};
}

klk::mdns::AnnouncementMode klk::mdns::get_mode(const Announcement& announcement) {
    return std::visit(ModeVisitor {}, announcement);
}

const klk::mdns::AnnouncementBase& klk::mdns::get_base(const Announcement& announcement) {
    return std::visit(
        [](const auto& a) -> const AnnouncementBase& {
            return a.base;
        },
        announcement
    );
}

const char* klk::mdns::to_string(const AnnouncementMode mode) {
    switch (mode) {
        case AnnouncementMode::new_service:
            return "new";
        case AnnouncementMode::resolved:
            return "resolved";
        case AnnouncementMode::exited:
            return "exited";
    }
    return "undefined";
}

const char* klk::mdns::to_string(const AddressFamily family) {
    switch (family) {
        case AddressFamily::ipv4:
            return k_ipv4_token;
        case AddressFamily::ipv6:
            return k_ipv6_token;
    }
    return "undefined";
}

std::string klk::mdns::to_string(const Announcement& announcement) {
    const auto& base = get_base(announcement);
    auto description = fmt::format(
        "{} \"{}\" type={} domain={} interface={} ({})", to_string(get_mode(announcement)), base.hostname,
        base.service_type, base.domain, base.interface_name, to_string(base.address_family)
    );
    if (const auto* resolved = std::get_if<ResolvedAnnouncement>(&announcement)) {
        description += fmt::format(
            " host={} address={} port={}", resolved->service.hostname, resolved->service.address.to_string(),
            resolved->service.port
        );
    }
    return description;
}
