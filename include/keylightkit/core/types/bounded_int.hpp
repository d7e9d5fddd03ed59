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
#include "keylightkit/core/json.hpp"
#include "keylightkit/core/string.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace klk {

/**
 * An unsigned integer which is guaranteed to be within the inclusive range [Min, Max]. Values can only be created
 * through create() and from_string(), which check the range.
 * @tparam T The unsigned integer type holding the value.
 * @tparam Min The lowest valid value.
 * @tparam Max The highest valid value.
 */
template<class T, T Min, T Max>
class BoundedInt {
  public:
    static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>, "T must be an unsigned integral type");
    static_assert(Min <= Max, "Min must not be greater than Max");

    static constexpr T k_min = Min;
    static constexpr T k_max = Max;

    /**
     * Constructs a value holding Min.
     */
    BoundedInt() = default;

    /**
     * Creates a value, checking the range.
     * @tparam U The type of the value, which can be signed.
     * @param value The value.
     * @return The value, or an error message if the value is outside the range.
     */
    template<class U>
    static tl::expected<BoundedInt, std::string> create(const U value) {
        static_assert(std::is_integral_v<U>, "U must be an integral type");
        if (!is_in_range(value)) {
            return tl::unexpected(fmt::format("{} is outside range [{}, {}]", value, +Min, +Max));
        }
        return BoundedInt(static_cast<T>(value));
    }

    /**
     * Creates a value from its decimal representation.
     * @param str The string.
     * @return The value, or an error message if the string is not a number or the number is outside the range.
     */
    static tl::expected<BoundedInt, std::string> from_string(const std::string_view str) {
        const auto number = string_to_int<int64_t>(str, true);
        if (!number) {
            return tl::unexpected(fmt::format("\"{}\" is not a number", str));
        }
        return create(*number);
    }

    /**
     * @return The value.
     */
    [[nodiscard]] T value() const {
        return value_;
    }

    /**
     * Moves the value by a percentage of the range, stopping at the bounds. The step is rounded towards zero.
     * @param percent The percentage of the range to move by, negative to move down.
     * @return The adjusted value.
     */
    [[nodiscard]] BoundedInt adjusted_by_percent(const int percent) const {
        constexpr auto range = static_cast<int64_t>(Max) - static_cast<int64_t>(Min);
        const auto step = range * percent / 100;
        auto adjusted = static_cast<int64_t>(value_) + step;
        if (adjusted < static_cast<int64_t>(Min)) {
            adjusted = Min;
        } else if (adjusted > static_cast<int64_t>(Max)) {
            adjusted = Max;
        }
        return BoundedInt(static_cast<T>(adjusted));
    }

    friend bool operator==(const BoundedInt& lhs, const BoundedInt& rhs) {
        return lhs.value_ == rhs.value_;
    }

    friend bool operator!=(const BoundedInt& lhs, const BoundedInt& rhs) {
        return !(lhs == rhs);
    }

    friend void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const BoundedInt& bounded) {
        jv = bounded.value_;
    }

    friend BoundedInt tag_invoke(const boost::json::value_to_tag<BoundedInt>&, const boost::json::value& jv) {
        auto bounded = create(jv.to_number<int64_t>());
        if (!bounded) {
            throw std::out_of_range(bounded.error());
        }
        return *bounded;
    }

  private:
    T value_ {Min};

    explicit BoundedInt(const T value) : value_(value) {}

    template<class U>
    static bool is_in_range(const U value) {
        if constexpr (std::is_signed_v<U>) {
            if (value < 0) {
                return false;
            }
        }
        const auto unsigned_value = static_cast<uint64_t>(value);
        return unsigned_value >= static_cast<uint64_t>(Min) && unsigned_value <= static_cast<uint64_t>(Max);
    }
};

/// The brightness of a light in percent.
using Brightness = BoundedInt<uint8_t, 0, 100>;

/// The color temperature of a light in the unit the lights use (143 is the coldest, 344 the warmest).
using Temperature = BoundedInt<uint16_t, 143, 344>;

}  // namespace klk
