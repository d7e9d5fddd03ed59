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

#include "avahi_browse.hpp"

#include "keylightkit/core/expected.hpp"
#include "keylightkit/mdns/mdns_announcement.hpp"
#include "keylightkit/mdns/mdns_device.hpp"

#include <boost/asio/io_context.hpp>

#include <functional>
#include <string_view>
#include <vector>

namespace klk::mdns {

using FindDevicesResult = tl::expected<std::vector<Device>, DiscoveryError>;

/**
 * Decodes the complete output of an avahi-browse run. Fails on the first line which can't be decoded.
 * @param output The output, one announcement per line.
 * @return The announcements in order, or a decode_error naming the line which failed.
 */
[[nodiscard]] tl::expected<std::vector<Announcement>, DiscoveryError> decode_output(std::string_view output);

/**
 * Turns announcements into a list of devices. Announcements which are not resolved are skipped, and devices with a
 * name which was seen before are dropped so that the first one wins.
 * @param announcements The announcements.
 * @return The devices in order of first appearance, or a resolve_error for the first device which could not be
 * resolved.
 */
[[nodiscard]] FindDevicesResult resolve_devices(const std::vector<Announcement>& announcements);

/**
 * Runs avahi-browse once (with --terminate) and collects the lights it reports. The whole operation runs on given
 * io_context, which must be run by the caller.
 * @param io_context The io_context.
 * @param config The configuration.
 * @param handler Called once, on the io_context, with the devices or the error which made the run fail.
 */
void async_find_devices(
    boost::asio::io_context& io_context, const AvahiBrowse::Config& config,
    std::function<void(FindDevicesResult)> handler
);

/**
 * Runs avahi-browse once and blocks until the lights are collected.
 * @param config The configuration.
 * @return The devices, or the error which made the run fail.
 */
[[nodiscard]] FindDevicesResult find_devices(const AvahiBrowse::Config& config = {});

}  // namespace klk::mdns
