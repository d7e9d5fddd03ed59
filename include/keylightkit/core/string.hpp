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

#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace klk {

/**
 * String to number - a small convenience function around std::from_chars.
 * @tparam Type Type of the value to convert from a string.
 * @param string String to convert to a value.
 * @param strict If true, the whole string must be a number, otherwise only the beginning of the string must be a
 * number.
 * @param base Base of the number to convert. When 16, the "0x" and "0X" prefixes are not recognized.
 * @return The converted value as optional, which will contain a value on success or will be empty on failure. Values
 * which don't fit in Type are a failure.
 */
template<typename Type>
std::enable_if_t<std::is_integral_v<Type>, std::optional<Type>>
string_to_int(std::string_view string, const bool strict = false, const int base = 10) {
    Type result {};
    auto [p, ec] = std::from_chars(string.data(), string.data() + string.size(), result, base);
    if (ec == std::errc() && (!strict || p >= string.data() + string.size()))
        return result;
    return {};
}

/**
 * Compares two strings, ignoring the case of ASCII letters.
 * @return True if both strings are equal, ignoring case.
 */
inline bool string_compare_case_insensitive(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }

    return true;
}

}  // namespace klk
