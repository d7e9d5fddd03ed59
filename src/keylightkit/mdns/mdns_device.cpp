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

#include <boost/url/parse.hpp>
#include <fmt/format.h>

std::string klk::mdns::Device::to_string() const {
    return fmt::format("{} => {}", name, std::string_view(url.buffer()));
}

tl::expected<boost::urls::url, std::string>
klk::mdns::make_device_url(const boost::asio::ip::address& address, const uint16_t port) {
    std::string text;
    if (address.is_v6()) {
        if (address.to_v6().scope_id() != 0) {
            return tl::unexpected(fmt::format("address {} carries a zone id", address.to_string()));
        }
        text = fmt::format("http://[{}]:{}/", address.to_string(), port);
    } else {
        text = fmt::format("http://{}:{}/", address.to_string(), port);
    }

    auto parsed = boost::urls::parse_absolute_uri(text);
    if (!parsed) {
        return tl::unexpected(fmt::format("invalid url {}: {}", text, parsed.error().message()));
    }
    return boost::urls::url(*parsed);
}

tl::expected<std::optional<klk::mdns::Device>, std::string>
klk::mdns::resolve_device(const Announcement& announcement) {
    const auto* resolved = std::get_if<ResolvedAnnouncement>(&announcement);
    if (resolved == nullptr) {
        return std::optional<Device> {};
    }

    auto url = make_device_url(resolved->service.address, resolved->service.port);
    if (!url) {
        return tl::unexpected(fmt::format("\"{}\": {}", resolved->base.hostname, url.error()));
    }

    return Device {resolved->base.hostname, std::move(*url)};
}
