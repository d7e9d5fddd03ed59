/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/mdns/avahi/avahi_browse.hpp"

#include "keylightkit/core/log.hpp"

#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/ranges.h>

namespace bp = boost::process::v2;

std::vector<std::string> klk::mdns::AvahiBrowse::make_arguments(const Config& config, const Mode mode) {
    std::vector<std::string> args {config.service_type, "--parsable", "--resolve"};
    if (mode == Mode::one_shot) {
        args.emplace_back("--terminate");
    }
    if (!config.domain.empty()) {
        args.emplace_back("--domain");
        args.push_back(config.domain);
    }
    return args;
}

tl::expected<bp::filesystem::path, klk::mdns::DiscoveryError>
klk::mdns::AvahiBrowse::find_executable(const std::string& executable) {
    if (executable.empty()) {
        return tl::unexpected(DiscoveryError {DiscoveryError::Kind::tool_not_found, "no executable configured"});
    }

    if (executable.find('/') != std::string::npos) {
        bp::filesystem::path path(executable);
        std::error_code ec;
        if (!bp::filesystem::exists(path, ec)) {
            return tl::unexpected(DiscoveryError {DiscoveryError::Kind::tool_not_found, executable});
        }
        return path;
    }

    auto path = bp::environment::find_executable(executable);
    if (path.empty()) {
        return tl::unexpected(DiscoveryError {
            DiscoveryError::Kind::tool_not_found, fmt::format("{} not installed", executable)
        });
    }
    return path;
}

tl::expected<klk::mdns::AvahiBrowse, klk::mdns::DiscoveryError>
klk::mdns::AvahiBrowse::spawn(boost::asio::io_context& io_context, const Config& config, const Mode mode) {
    auto executable = find_executable(config.executable);
    if (!executable) {
        return tl::unexpected(executable.error());
    }

    const auto args = make_arguments(config, mode);
    KLK_DEBUG("Spawning {} {}", executable->string(), fmt::join(args, " "));

    try {
        boost::asio::readable_pipe output(io_context);
        bp::process process(io_context, *executable, args, bp::process_stdio {nullptr, output, {}});
        return AvahiBrowse(std::move(output), std::move(process));
    } catch (const boost::system::system_error& e) {
        return tl::unexpected(DiscoveryError {
            DiscoveryError::Kind::process_error, fmt::format("failed to spawn {}: {}", executable->string(), e.what())
        });
    }
}

boost::asio::readable_pipe& klk::mdns::AvahiBrowse::output() {
    return output_;
}

bp::process& klk::mdns::AvahiBrowse::process() {
    return process_;
}

void klk::mdns::AvahiBrowse::request_exit() {
    if (!process_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    process_.request_exit(ec);
    if (ec) {
        KLK_ERROR("Failed to request avahi-browse to exit: {}", ec.message());
    }
}

void klk::mdns::AvahiBrowse::terminate() {
    if (!process_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    process_.terminate(ec);
    if (ec) {
        KLK_ERROR("Failed to terminate avahi-browse: {}", ec.message());
    }
}

klk::mdns::AvahiBrowse::AvahiBrowse(boost::asio::readable_pipe output, bp::process process) :
    output_(std::move(output)), process_(std::move(process)) {}

const char* klk::mdns::to_string(const DiscoveryError::Kind kind) {
    switch (kind) {
        case DiscoveryError::Kind::tool_not_found:
            return "tool_not_found";
        case DiscoveryError::Kind::process_error:
            return "process_error";
        case DiscoveryError::Kind::output_read_error:
            return "output_read_error";
        case DiscoveryError::Kind::decode_error:
            return "decode_error";
        case DiscoveryError::Kind::resolve_error:
            return "resolve_error";
    }
    return "undefined";
}
