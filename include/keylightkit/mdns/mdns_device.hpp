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

#include "mdns_announcement.hpp"

#include "keylightkit/core/expected.hpp"

#include <boost/url/url.hpp>

#include <optional>
#include <string>

namespace klk::mdns {

/**
 * A light found on the network.
 *
 * Devices are identified by name only: a light which moves from one address to another (it happens, lights flap
 * between IPv4 and a link-local IPv6 address) is still the same light.
 */
struct Device {
    /// The service instance name (i.e. "Elgato Key Light 8D7C").
    std::string name;

    /// The base url of the HTTP API of the device (i.e. http://192.168.0.92:9123/).
    boost::urls::url url;

    /// Compares by name only.
    bool operator==(const Device& other) const {
        return name == other.name;
    }

    bool operator!=(const Device& other) const {
        return !(*this == other);
    }

    /**
     * @return A description in the form "name => url".
     */
    [[nodiscard]] std::string to_string() const;
};

/**
 * Builds the base url for a service listening on given address and port: "http://{address}:{port}/", with IPv6
 * addresses between brackets.
 * @param address The address.
 * @param port The port.
 * @return The url, or an error message if the address can't be expressed in a url (i.e. it carries a zone id).
 */
[[nodiscard]] tl::expected<boost::urls::url, std::string>
make_device_url(const boost::asio::ip::address& address, uint16_t port);

/**
 * Turns a resolved announcement into a device. Other announcements don't carry an address and produce nothing.
 * @param announcement The announcement.
 * @return The device for Resolved announcements, an empty optional for New and Exited announcements, or an error
 * message if the url could not be built.
 */
[[nodiscard]] tl::expected<std::optional<Device>, std::string> resolve_device(const Announcement& announcement);

}  // namespace klk::mdns
