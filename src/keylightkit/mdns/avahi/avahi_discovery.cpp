/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/mdns/avahi/avahi_discovery.hpp"

#include "keylightkit/core/log.hpp"
#include "keylightkit/core/string_parser.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <memory>
#include <optional>

namespace {

/**
 * Reads the output of avahi-browse until EOF, then waits for the process to exit.
 */
class FindDevicesOperation: public std::enable_shared_from_this<FindDevicesOperation> {
  public:
    FindDevicesOperation(klk::mdns::AvahiBrowse browse, std::function<void(klk::mdns::FindDevicesResult)> handler) :
        browse_(std::move(browse)), handler_(std::move(handler)) {}

    void start() {
        boost::asio::async_read(
            browse_.output(), boost::asio::dynamic_buffer(output_),
            [self = shared_from_this()](const boost::system::error_code& ec, const size_t bytes_read) {
                self->on_read(ec, bytes_read);
            }
        );
    }

  private:
    klk::mdns::AvahiBrowse browse_;
    std::function<void(klk::mdns::FindDevicesResult)> handler_;
    std::string output_;
    std::optional<klk::mdns::DiscoveryError> read_error_;

    void on_read(const boost::system::error_code& ec, const size_t bytes_read) {
        if (ec && ec != boost::asio::error::eof) {
            read_error_ = klk::mdns::DiscoveryError {
                klk::mdns::DiscoveryError::Kind::output_read_error,
                fmt::format("failed to read output of avahi-browse: {}", ec.message())
            };
            // Don't leave the process behind.
            browse_.terminate();
        }

        KLK_TRACE("Read {} bytes from avahi-browse", bytes_read);

        browse_.process().async_wait(
            [self = shared_from_this()](const boost::system::error_code& wait_ec, const int exit_code) {
                self->on_exit(wait_ec, exit_code);
            }
        );
    }

    void on_exit(const boost::system::error_code& ec, const int exit_code) {
        if (read_error_) {
            handler_(tl::unexpected(*read_error_));
            return;
        }

        if (ec) {
            handler_(tl::unexpected(klk::mdns::DiscoveryError {
                klk::mdns::DiscoveryError::Kind::process_error,
                fmt::format("failed to wait for avahi-browse: {}", ec.message())
            }));
            return;
        }

        if (exit_code != 0) {
            KLK_WARNING("avahi-browse exited with code {}", exit_code);
        }

        auto announcements = klk::mdns::decode_output(output_);
        if (!announcements) {
            handler_(tl::unexpected(announcements.error()));
            return;
        }

        handler_(klk::mdns::resolve_devices(*announcements));
    }
};

}  // namespace

tl::expected<std::vector<klk::mdns::Announcement>, klk::mdns::DiscoveryError>
klk::mdns::decode_output(const std::string_view output) {
    std::vector<Announcement> announcements;
    StringParser parser(output);
    while (const auto line = parser.read_line()) {
        auto announcement = decode_announcement(*line);
        if (!announcement) {
            return tl::unexpected(DiscoveryError {
                DiscoveryError::Kind::decode_error, fmt::format("{} in line \"{}\"", announcement.error(), *line)
            });
        }
        announcements.push_back(std::move(*announcement));
    }
    return announcements;
}

klk::mdns::FindDevicesResult klk::mdns::resolve_devices(const std::vector<Announcement>& announcements) {
    std::vector<Device> devices;
    for (const auto& announcement : announcements) {
        auto device = resolve_device(announcement);
        if (!device) {
            return tl::unexpected(DiscoveryError {DiscoveryError::Kind::resolve_error, std::move(device.error())});
        }
        if (!device->has_value()) {
            continue;
        }
        if (std::find(devices.begin(), devices.end(), device->value()) != devices.end()) {
            continue;
        }
        devices.push_back(std::move(device->value()));
    }
    return devices;
}

void klk::mdns::async_find_devices(
    boost::asio::io_context& io_context, const AvahiBrowse::Config& config,
    std::function<void(FindDevicesResult)> handler
) {
    auto browse = AvahiBrowse::spawn(io_context, config, AvahiBrowse::Mode::one_shot);
    if (!browse) {
        boost::asio::post(io_context, [h = std::move(handler), error = browse.error()] {
            h(tl::unexpected(error));
        });
        return;
    }

    std::make_shared<FindDevicesOperation>(std::move(*browse), std::move(handler))->start();
}

klk::mdns::FindDevicesResult klk::mdns::find_devices(const AvahiBrowse::Config& config) {
    boost::asio::io_context io_context;
    std::optional<FindDevicesResult> result;

    async_find_devices(io_context, config, [&result](FindDevicesResult r) {
        result = std::move(r);
    });

    io_context.run();

    if (!result) {
        return tl::unexpected(DiscoveryError {DiscoveryError::Kind::process_error, "discovery did not complete"});
    }
    return std::move(*result);
}
