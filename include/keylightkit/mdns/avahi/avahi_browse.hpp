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

#include "keylightkit/core/expected.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/process.hpp>
#include <fmt/ostream.h>

#include <ostream>
#include <string>
#include <vector>

namespace klk::mdns {

/**
 * An error which makes a discovery run fail.
 */
struct DiscoveryError {
    enum class Kind {
        /// The avahi-browse executable could not be found.
        tool_not_found,
        /// The process could not be spawned or waited for.
        process_error,
        /// Reading the output of the process failed.
        output_read_error,
        /// A line of output could not be decoded.
        decode_error,
        /// A resolved service could not be turned into a device.
        resolve_error,
    };

    Kind kind {};
    std::string message;

    bool operator==(const DiscoveryError& other) const {
        return kind == other.kind && message == other.message;
    }

    bool operator!=(const DiscoveryError& other) const {
        return !(*this == other);
    }
};

const char* to_string(DiscoveryError::Kind kind);

/// Overload the output stream operator for DiscoveryError::Kind
inline std::ostream& operator<<(std::ostream& os, const DiscoveryError::Kind kind) {
    return os << to_string(kind);
}

/// Overload the output stream operator for DiscoveryError
inline std::ostream& operator<<(std::ostream& os, const DiscoveryError& error) {
    return os << to_string(error.kind) << ": " << error.message;
}

/**
 * A running avahi-browse process with its standard output connected to a pipe.
 */
class AvahiBrowse {
  public:
    /// The name of the executable, looked up in PATH.
    static constexpr auto k_default_executable = "avahi-browse";

    /// The service type under which the lights announce themselves.
    static constexpr auto k_elgato_service_type = "_elg._tcp";

    struct Config {
        /// The executable to run. A name is looked up in PATH, a path (containing a '/') is used as is.
        std::string executable {k_default_executable};

        /// The service type to browse for.
        std::string service_type {k_elgato_service_type};

        /// The domain to browse in. Empty means the default domain.
        std::string domain;
    };

    enum class Mode {
        /// Dump the current cache and exit (--terminate).
        one_shot,
        /// Keep running and report changes as they happen.
        streaming,
    };

    /**
     * @param config The configuration.
     * @param mode The mode.
     * @return The arguments to pass to avahi-browse.
     */
    [[nodiscard]] static std::vector<std::string> make_arguments(const Config& config, Mode mode);

    /**
     * Finds the executable to run.
     * @param executable A name to look up in PATH, or a path.
     * @return The path to the executable, or a tool_not_found error.
     */
    [[nodiscard]] static tl::expected<boost::process::v2::filesystem::path, DiscoveryError>
    find_executable(const std::string& executable);

    /**
     * Spawns avahi-browse. Standard input is closed, standard error is inherited.
     * @param io_context The io_context to run the process and the pipe on.
     * @param config The configuration.
     * @param mode The mode.
     * @return The running process, or an error if the executable was not found or could not be spawned.
     */
    [[nodiscard]] static tl::expected<AvahiBrowse, DiscoveryError>
    spawn(boost::asio::io_context& io_context, const Config& config, Mode mode);

    AvahiBrowse(AvahiBrowse&&) = default;
    AvahiBrowse& operator=(AvahiBrowse&&) = default;

    /**
     * @return The read end of the pipe connected to the standard output of the process.
     */
    [[nodiscard]] boost::asio::readable_pipe& output();

    /**
     * @return The process.
     */
    [[nodiscard]] boost::process::v2::process& process();

    /**
     * Asks the process to exit (SIGTERM). Errors are logged.
     */
    void request_exit();

    /**
     * Kills the process (SIGKILL). Errors are logged.
     */
    void terminate();

  private:
    boost::asio::readable_pipe output_;
    boost::process::v2::process process_;

    AvahiBrowse(boost::asio::readable_pipe output, boost::process::v2::process process);
};

}  // namespace klk::mdns

/// Make DiscoveryError::Kind printable with fmt
template<>
struct fmt::formatter<klk::mdns::DiscoveryError::Kind>: ostream_formatter {};

/// Make DiscoveryError printable with fmt
template<>
struct fmt::formatter<klk::mdns::DiscoveryError>: ostream_formatter {};
