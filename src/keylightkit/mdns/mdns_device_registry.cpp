/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/mdns/mdns_device_registry.hpp"

#include "keylightkit/core/assert.hpp"
#include "keylightkit/core/log.hpp"

#include <algorithm>

klk::mdns::DeviceRegistry::DeviceRegistry(const std::vector<Device>& devices) {
    for (const auto& device : devices) {
        add(device);
    }
}

klk::mdns::DeviceRegistry::Change klk::mdns::DeviceRegistry::apply(const Announcement& announcement) {
    if (std::holds_alternative<NewAnnouncement>(announcement)) {
        return Change::ignored;
    }

    if (const auto* exited = std::get_if<ExitedAnnouncement>(&announcement)) {
        if (remove(exited->base.hostname)) {
            KLK_INFO("Device removed: {}", exited->base.hostname);
            return Change::removed;
        }
        KLK_DEBUG("Device {} exited but was not known", exited->base.hostname);
        return Change::not_found;
    }

    auto device = resolve_device(announcement);
    if (!device) {
        KLK_ERROR("Failed to resolve device: {}", device.error());
        return Change::unresolvable;
    }

    KLK_ASSERT_RETURN_WITH(device->has_value(), "A resolved announcement must produce a device", Change::ignored);

    auto& new_device = device->value();
    if (find(new_device.name) != nullptr) {
        KLK_DEBUG("Device {} already known", new_device.to_string());
        return Change::duplicate;
    }

    KLK_INFO("New device found: {}", new_device.to_string());
    devices_.push_back(std::move(new_device));
    return Change::added;
}

bool klk::mdns::DeviceRegistry::add(Device device) {
    if (find(device.name) != nullptr) {
        return false;
    }
    devices_.push_back(std::move(device));
    return true;
}

bool klk::mdns::DeviceRegistry::remove(const std::string_view name) {
    const auto it = std::find_if(devices_.begin(), devices_.end(), [name](const Device& device) {
        return device.name == name;
    });
    if (it == devices_.end()) {
        return false;
    }
    devices_.erase(it);
    return true;
}

const klk::mdns::Device* klk::mdns::DeviceRegistry::find(const std::string_view name) const {
    for (const auto& device : devices_) {
        if (device.name == name) {
            return &device;
        }
    }
    return nullptr;
}

const std::vector<klk::mdns::Device>& klk::mdns::DeviceRegistry::get_devices() const {
    return devices_;
}

size_t klk::mdns::DeviceRegistry::size() const {
    return devices_.size();
}

bool klk::mdns::DeviceRegistry::empty() const {
    return devices_.empty();
}

const char* klk::mdns::to_string(const DeviceRegistry::Change change) {
    switch (change) {
        case DeviceRegistry::Change::ignored:
            return "ignored";
        case DeviceRegistry::Change::added:
            return "added";
        case DeviceRegistry::Change::duplicate:
            return "duplicate";
        case DeviceRegistry::Change::removed:
            return "removed";
        case DeviceRegistry::Change::not_found:
            return "not_found";
        case DeviceRegistry::Change::unresolvable:
            return "unresolvable";
    }
    return "undefined";
}
