/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/mdns/avahi/avahi_daemon.hpp"

#include "keylightkit/core/log.hpp"
#include "keylightkit/mdns/mdns_announcement.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <fmt/format.h>

#include <thread>

klk::mdns::DiscoveryDaemon::DiscoveryDaemon(AvahiBrowse::Config config) : config_(std::move(config)) {}

klk::mdns::DiscoveryDaemon::DiscoveryDaemon(AvahiBrowse::Config config, const std::vector<Device>& devices) :
    config_(std::move(config)), registry_(devices) {}

klk::mdns::DiscoveryDaemon::~DiscoveryDaemon() {
    stop();
}

klk::mdns::DiscoveryDaemon::RunResult klk::mdns::DiscoveryDaemon::start() {
    using namespace std::chrono_literals;

    std::lock_guard guard(lock_);

    if (future_.valid() && future_.wait_for(0s) != std::future_status::ready) {
        KLK_ERROR("Discovery daemon is already running");
        return {};
    }

    // Start from a clean io_context so that nothing posted during a previous run is executed.
    browse_.reset();
    io_context_ = std::make_unique<boost::asio::io_context>();

    auto browse = AvahiBrowse::spawn(*io_context_, config_, AvahiBrowse::Mode::streaming);
    if (!browse) {
        return tl::unexpected(browse.error());
    }

    browse_.emplace(std::move(*browse));
    buffer_.clear();
    result_ = {};
    thread_id_ = {};
    ++run_count_;

    read_next_line();

    future_ = std::async(std::launch::async, [this] {
        return run();
    });

    KLK_TRACE("Discovery daemon started");
    return {};
}

void klk::mdns::DiscoveryDaemon::stop() {
    using namespace std::chrono_literals;

    std::shared_future<RunResult> future;
    size_t run_count = 0;

    {
        std::lock_guard guard(lock_);

        if (!future_.valid() || future_.wait_for(0s) == std::future_status::ready) {
            return;
        }

        future = future_;
        run_count = run_count_;

        boost::asio::post(*io_context_, [this] {
            if (browse_) {
                browse_->request_exit();
            }
        });

        if (std::this_thread::get_id() == thread_id_) {
            KLK_DEBUG("Stop requested from the discovery thread, not waiting for it");
            return;
        }
    }

    if (future.wait_for(1000ms) == std::future_status::ready) {
        KLK_TRACE("Discovery daemon stopped");
        return;
    }

    KLK_WARNING("avahi-browse did not exit in time, killing it");
    {
        std::lock_guard guard(lock_);
        if (run_count == run_count_) {
            boost::asio::post(*io_context_, [this] {
                if (browse_) {
                    browse_->terminate();
                }
            });
        }
    }

    if (future.wait_for(1000ms) != std::future_status::ready) {
        KLK_ERROR("Failed to stop discovery thread, stopping io_context");
        std::lock_guard guard(lock_);
        if (run_count == run_count_) {
            io_context_->stop();
        }
    }

    future.wait();
}

bool klk::mdns::DiscoveryDaemon::is_running() {
    using namespace std::chrono_literals;
    std::lock_guard guard(lock_);
    if (future_.valid()) {
        return future_.wait_for(0s) != std::future_status::ready;
    }
    return false;
}

klk::mdns::DiscoveryDaemon::RunResult klk::mdns::DiscoveryDaemon::wait() {
    std::shared_future<RunResult> future;
    {
        std::lock_guard guard(lock_);
        future = future_;
    }
    if (!future.valid()) {
        return {};
    }
    return future.get();
}

std::optional<klk::mdns::DeviceRegistry::Change> klk::mdns::DiscoveryDaemon::handle_line(const std::string_view line) {
    const auto announcement = decode_announcement(line);
    if (!announcement) {
        KLK_ERROR("Failed to decode line \"{}\": {}", line, announcement.error());
        return std::nullopt;
    }

    KLK_TRACE("Announcement: {}", to_string(*announcement));

    const auto change = registry_.apply(*announcement);
    if (!change) {
        return std::nullopt;
    }

    const bool changed = *change == DeviceRegistry::Change::added || *change == DeviceRegistry::Change::removed;
    if (changed && on_registry_changed) {
        on_registry_changed(*change);
    }

    return change;
}

klk::mdns::SharedDeviceRegistry& klk::mdns::DiscoveryDaemon::registry() {
    return registry_;
}

void klk::mdns::DiscoveryDaemon::read_next_line() {
    boost::asio::async_read_until(
        browse_->output(), boost::asio::dynamic_buffer(buffer_), '\n',
        [this](const boost::system::error_code& ec, const size_t length) {
            on_line_read(ec, length);
        }
    );
}

void klk::mdns::DiscoveryDaemon::on_line_read(const boost::system::error_code& ec, const size_t length) {
    if (ec) {
        if (ec == boost::asio::error::eof) {
            // The output may end without a newline.
            if (!buffer_.empty()) {
                handle_line_safely(buffer_);
                buffer_.clear();
            }
            KLK_DEBUG("avahi-browse closed its output");
        } else {
            KLK_ERROR("Failed to read output of avahi-browse: {}", ec.message());
            result_ = tl::unexpected(DiscoveryError {
                DiscoveryError::Kind::output_read_error,
                fmt::format("failed to read output of avahi-browse: {}", ec.message())
            });
            browse_->terminate();
        }
        wait_for_exit();
        return;
    }

    std::string_view line(buffer_.data(), length - 1);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    handle_line_safely(line);

    buffer_.erase(0, length);
    read_next_line();
}

void klk::mdns::DiscoveryDaemon::handle_line_safely(const std::string_view line) {
    try {
        handle_line(line);
    } catch (const std::exception& e) {
        KLK_ERROR("Exception while handling line \"{}\": {}", line, e.what());
    }
}

void klk::mdns::DiscoveryDaemon::wait_for_exit() {
    browse_->process().async_wait([this](const boost::system::error_code& ec, const int exit_code) {
        if (ec) {
            KLK_ERROR("Failed to wait for avahi-browse: {}", ec.message());
            if (result_) {
                result_ = tl::unexpected(DiscoveryError {
                    DiscoveryError::Kind::process_error,
                    fmt::format("failed to wait for avahi-browse: {}", ec.message()),
                });
            }
            return;
        }
        KLK_DEBUG("avahi-browse exited with code {}", exit_code);
    });
}

klk::mdns::DiscoveryDaemon::RunResult klk::mdns::DiscoveryDaemon::run() {
    KLK_TRACE("Start discovery thread");

    {
        std::lock_guard guard(lock_);
        thread_id_ = std::this_thread::get_id();
    }

    while (true) {
        try {
            io_context_->run();
            break;
        } catch (const std::exception& e) {
            KLK_ERROR("Unhandled exception on discovery thread: {}", e.what());
            if (result_) {
                result_ = tl::unexpected(DiscoveryError {DiscoveryError::Kind::process_error, e.what()});
            }
            if (browse_) {
                browse_->terminate();
            }
        }
    }

    KLK_TRACE("Discovery thread finished");
    return result_;
}
