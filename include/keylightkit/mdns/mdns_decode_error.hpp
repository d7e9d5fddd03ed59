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

#include <fmt/ostream.h>

#include <ostream>
#include <string>

namespace klk::mdns {

/**
 * Describes why a line of avahi-browse output could not be decoded.
 */
struct DecodeError {
    enum class Kind {
        /// A mandatory field is missing.
        not_enough_arguments,
        /// The first character is not one of '+', '=' or '-'.
        invalid_mode,
        /// The address family is not "IPv4" or "IPv6".
        invalid_address_family,
        /// The address of a resolved announcement is not a numeric IPv4 or IPv6 address.
        invalid_address,
        /// The port of a resolved announcement is not a number in the range [0, 65535].
        invalid_port,
        /// An escape sequence encodes a value above 255.
        invalid_escape,
    };

    Kind kind {Kind::not_enough_arguments};

    /// The offending field, or the name of the missing field.
    std::string context;

    bool operator==(const DecodeError& other) const {
        return kind == other.kind && context == other.context;
    }
};

inline const char* to_string(const DecodeError::Kind kind) {
    switch (kind) {
        case DecodeError::Kind::not_enough_arguments:
            return "not enough arguments";
        case DecodeError::Kind::invalid_mode:
            return "invalid mode";
        case DecodeError::Kind::invalid_address_family:
            return "invalid address family";
        case DecodeError::Kind::invalid_address:
            return "invalid address";
        case DecodeError::Kind::invalid_port:
            return "invalid port";
        case DecodeError::Kind::invalid_escape:
            return "invalid escape sequence";
    }
    return "unknown";
}

/// Overload the output stream operator for DecodeError.
inline std::ostream& operator<<(std::ostream& os, const DecodeError& error) {
    os << to_string(error.kind);
    if (!error.context.empty()) {
        os << ": " << error.context;
    }
    return os;
}

}  // namespace klk::mdns

/// Make DecodeError printable with fmt
template<>
struct fmt::formatter<klk::mdns::DecodeError>: ostream_formatter {};
