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
#include "keylightkit/mdns/mdns_shared_device_registry.hpp"

#include <boost/asio/io_context.hpp>

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace klk::mdns {

/**
 * Keeps a registry of lights up to date by running avahi-browse in streaming mode on a background thread. Every line
 * the process prints is decoded and applied to the registry. Lines which can't be decoded are logged and skipped.
 *
 * The thread ends when avahi-browse exits, when reading its output fails, or when stop() is called.
 */
class DiscoveryDaemon {
  public:
    using RunResult = tl::expected<void, DiscoveryError>;

    /**
     * Called on the background thread after a device was added to or removed from the registry. The registry is not
     * locked while the callback runs. The callback may call is_running(), start() and stop(). Calling stop() from the
     * callback only asks avahi-browse to exit and returns without waiting.
     */
    std::function<void(DeviceRegistry::Change change)> on_registry_changed;

    explicit DiscoveryDaemon(AvahiBrowse::Config config = {});

    /**
     * Constructs a daemon with a registry seeded with given devices, for example the result of find_devices().
     * @param config The configuration.
     * @param devices The initial devices.
     */
    DiscoveryDaemon(AvahiBrowse::Config config, const std::vector<Device>& devices);

    ~DiscoveryDaemon();

    DiscoveryDaemon(const DiscoveryDaemon&) = delete;
    DiscoveryDaemon& operator=(const DiscoveryDaemon&) = delete;

    DiscoveryDaemon(DiscoveryDaemon&&) = delete;
    DiscoveryDaemon& operator=(DiscoveryDaemon&&) = delete;

    /**
     * Spawns avahi-browse and starts the background thread. Does nothing if the daemon is already running.
     * @return An error if avahi-browse could not be found or spawned.
     */
    RunResult start();

    /**
     * Asks avahi-browse to exit and waits for the background thread to finish. If the process doesn't exit in time it
     * is killed. No lock is held while waiting.
     */
    void stop();

    /**
     * @return True if the background thread is running.
     */
    [[nodiscard]] bool is_running();

    /**
     * Waits until the background thread finished, which happens when avahi-browse exits.
     * @return The reason the thread ended: success when the output ended normally, or the error which ended it. Success
     * if the daemon was never started.
     */
    RunResult wait();

    /**
     * Decodes one line of avahi-browse output and applies it to the registry. Called on the background thread for
     * every line, but can be called directly too.
     * @param line The line, without the line terminator.
     * @return What happened to the registry, or an empty optional if the line could not be decoded or the registry
     * could not be locked.
     */
    std::optional<DeviceRegistry::Change> handle_line(std::string_view line);

    /**
     * @return The registry which is kept up to date.
     */
    [[nodiscard]] SharedDeviceRegistry& registry();

  private:
    AvahiBrowse::Config config_;
    SharedDeviceRegistry registry_;
    std::unique_ptr<boost::asio::io_context> io_context_;
    std::optional<AvahiBrowse> browse_;
    std::string buffer_;
    RunResult result_;
    std::shared_future<RunResult> future_;
    std::thread::id thread_id_;
    size_t run_count_ {0};
    std::mutex lock_;

    void read_next_line();
    void on_line_read(const boost::system::error_code& ec, size_t length);
    void handle_line_safely(std::string_view line);
    void wait_for_exit();
    RunResult run();
};

}  // namespace klk::mdns
