/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/mdns/mdns_shared_device_registry.hpp"

#include "keylightkit/core/log.hpp"

klk::mdns::SharedDeviceRegistry::SharedDeviceRegistry(const std::vector<Device>& devices) : registry_(devices) {}

std::optional<klk::mdns::DeviceRegistry::Change>
klk::mdns::SharedDeviceRegistry::apply(const Announcement& announcement) {
    const auto guard = lock_.lock_exclusive();
    if (!guard) {
        KLK_ERROR("Failed to acquire exclusive access to the device registry");
        return std::nullopt;
    }

    const auto change = registry_.apply(announcement);
    if (change == DeviceRegistry::Change::added || change == DeviceRegistry::Change::removed) {
        generation_.fetch_add(1, std::memory_order_release);
    }
    return change;
}

std::optional<std::vector<klk::mdns::Device>> klk::mdns::SharedDeviceRegistry::get_devices() {
    const auto guard = lock_.lock_shared();
    if (!guard) {
        KLK_ERROR("Failed to acquire shared access to the device registry");
        return std::nullopt;
    }
    return registry_.get_devices();
}

std::optional<std::vector<klk::mdns::Device>> klk::mdns::SharedDeviceRegistry::try_get_devices() {
    const auto guard = lock_.try_lock_shared();
    if (!guard) {
        return std::nullopt;
    }
    return registry_.get_devices();
}

uint64_t klk::mdns::SharedDeviceRegistry::get_generation() const {
    return generation_.load(std::memory_order_acquire);
}
