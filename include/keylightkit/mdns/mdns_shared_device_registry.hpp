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

#include "mdns_device_registry.hpp"

#include "keylightkit/core/sync/atomic_rw_lock.hpp"

#include <atomic>
#include <optional>
#include <vector>

namespace klk::mdns {

/**
 * A DeviceRegistry guarded by a reader writer lock. One writer applies announcements, any number of readers copy out
 * the list of devices. Readers see the list either before or after an announcement was applied, never in between.
 */
class SharedDeviceRegistry {
  public:
    SharedDeviceRegistry() = default;

    /**
     * Constructs a registry seeded with given devices.
     * @param devices The initial devices.
     */
    explicit SharedDeviceRegistry(const std::vector<Device>& devices);

    SharedDeviceRegistry(const SharedDeviceRegistry&) = delete;
    SharedDeviceRegistry& operator=(const SharedDeviceRegistry&) = delete;

    SharedDeviceRegistry(SharedDeviceRegistry&&) = delete;
    SharedDeviceRegistry& operator=(SharedDeviceRegistry&&) = delete;

    /**
     * Applies an announcement while holding exclusive access.
     * Thread safe: yes
     * @param announcement The announcement to apply.
     * @return What happened, or an empty optional if exclusive access could not be acquired.
     */
    std::optional<DeviceRegistry::Change> apply(const Announcement& announcement);

    /**
     * Copies the devices while holding shared access. Waits for a writer to finish.
     * Thread safe: yes
     * @return The devices, or an empty optional if shared access could not be acquired.
     */
    [[nodiscard]] std::optional<std::vector<Device>> get_devices();

    /**
     * Copies the devices if shared access can be acquired right away.
     * Thread safe: yes
     * @return The devices, or an empty optional when a writer holds or waits for the lock.
     */
    [[nodiscard]] std::optional<std::vector<Device>> try_get_devices();

    /**
     * @return A number which increments with every change to the list of devices. Can be used to poll for changes
     * without taking the lock.
     */
    [[nodiscard]] uint64_t get_generation() const;

  private:
    AtomicRwLock lock_;
    DeviceRegistry registry_;
    std::atomic<uint64_t> generation_ {0};
};

}  // namespace klk::mdns
