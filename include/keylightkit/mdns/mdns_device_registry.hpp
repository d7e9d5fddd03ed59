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
#include "mdns_device.hpp"

#include <fmt/ostream.h>

#include <ostream>
#include <string_view>
#include <vector>

namespace klk::mdns {

/**
 * Keeps the list of lights which are currently on the network, driven by announcements. Holds at most one device per
 * name, in the order in which the devices were first resolved.
 *
 * This class is not thread safe, see SharedDeviceRegistry.
 */
class DeviceRegistry {
  public:
    /**
     * The outcome of applying an announcement.
     */
    enum class Change {
        /// The announcement doesn't affect the registry (New announcements).
        ignored,
        /// A device was added.
        added,
        /// A device with the same name was already known.
        duplicate,
        /// A device was removed.
        removed,
        /// No device with the name of the Exited announcement was known.
        not_found,
        /// The Resolved announcement could not be turned into a device.
        unresolvable,
    };

    DeviceRegistry() = default;

    /**
     * Constructs a registry holding the given devices. Devices with a name which was seen before are dropped.
     * @param devices The devices, for example the result of a one-shot discovery.
     */
    explicit DeviceRegistry(const std::vector<Device>& devices);

    /**
     * Applies an announcement:
     *  - New: nothing happens.
     *  - Resolved: the device is appended, unless a device with the same name is known already.
     *  - Exited: the device with the same name is removed, if there is one.
     * @param announcement The announcement to apply.
     * @return What happened.
     */
    Change apply(const Announcement& announcement);

    /**
     * Adds a device unless a device with the same name exists.
     * @return True if the device was added.
     */
    bool add(Device device);

    /**
     * Removes the device with given name.
     * @return True if a device was removed.
     */
    bool remove(std::string_view name);

    /**
     * @return The device with given name, or nullptr if there is none.
     */
    [[nodiscard]] const Device* find(std::string_view name) const;

    /**
     * @return The devices, in order of discovery.
     */
    [[nodiscard]] const std::vector<Device>& get_devices() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

  private:
    std::vector<Device> devices_;
};

const char* to_string(DeviceRegistry::Change change);

/// Overload the output stream operator for DeviceRegistry::Change
inline std::ostream& operator<<(std::ostream& os, const DeviceRegistry::Change change) {
    return os << to_string(change);
}

}  // namespace klk::mdns

/// Make DeviceRegistry::Change printable with fmt
template<>
struct fmt::formatter<klk::mdns::DeviceRegistry::Change>: ostream_formatter {};
