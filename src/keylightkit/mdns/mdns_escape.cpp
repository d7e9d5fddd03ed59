/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/mdns/mdns_escape.hpp"

#include "keylightkit/core/string.hpp"

#include <fmt/format.h>

namespace {

constexpr size_t k_max_escape_digits = 3;

bool is_digit(const char c) {
    return c >= '0' && c <= '9';
}

tl::expected<std::string, klk::mdns::DecodeError> decode(const std::string_view text, const bool unescape_dots) {
    std::string decoded;
    decoded.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '\\') {
            decoded.push_back(text[i++]);
            continue;
        }

        // An escaped backslash never starts another escape.
        if (i + 1 < text.size() && (text[i + 1] == '\\' || (unescape_dots && text[i + 1] == '.'))) {
            decoded.push_back(text[i + 1]);
            i += 2;
            continue;
        }

        size_t num_digits = 0;
        while (num_digits < k_max_escape_digits && i + 1 + num_digits < text.size()
               && is_digit(text[i + 1 + num_digits])) {
            ++num_digits;
        }

        if (num_digits == 0) {
            decoded.push_back(text[i++]);  // Lone backslash
            continue;
        }

        const auto digits = text.substr(i + 1, num_digits);
        const auto value = klk::string_to_int<unsigned>(digits, true);
        if (!value || *value > 255) {
            return tl::unexpected(
                klk::mdns::DecodeError {klk::mdns::DecodeError::Kind::invalid_escape, fmt::format("\\{}", digits)}
            );
        }

        decoded.push_back(static_cast<char>(*value));
        i += 1 + num_digits;
    }

    return decoded;
}

}  // namespace

tl::expected<std::string, klk::mdns::DecodeError> klk::mdns::decode_escaped_octets(const std::string_view text) {
    return decode(text, false);
}

tl::expected<std::string, klk::mdns::DecodeError> klk::mdns::decode_instance_name(const std::string_view text) {
    return decode(text, true);
}
