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

#include "mdns_decode_error.hpp"

#include "keylightkit/core/expected.hpp"

#include <string>
#include <string_view>

namespace klk::mdns {

/**
 * Decodes the decimal escape sequences avahi uses for bytes which are not printable in a DNS label. A backslash
 * followed by one to three decimal digits is replaced by the byte with that value, so "Elgato\032Key" becomes
 * "Elgato Key". Up to three digits are consumed, "\0328D7C" decodes to " 8D7C". An escaped backslash ("\\") decodes
 * to a single backslash and never starts a sequence. Everything else is copied as is.
 * @param text The text to decode.
 * @return The decoded text, or an invalid_escape error if a sequence encodes a value above 255.
 */
[[nodiscard]] tl::expected<std::string, DecodeError> decode_escaped_octets(std::string_view text);

/**
 * Decodes a service instance name as printed by avahi-browse: like decode_escaped_octets(), but escaped dots ("\.")
 * decode to plain dots too.
 * @param text The instance name as printed.
 * @return The decoded name, or an invalid_escape error.
 */
[[nodiscard]] tl::expected<std::string, DecodeError> decode_instance_name(std::string_view text);

}  // namespace klk::mdns
