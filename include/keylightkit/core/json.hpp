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

#include <boost/json.hpp>
#include <boost/json/value_from.hpp>  // Don't remove or suffer the errors
#include <boost/json/value_to.hpp>    // Don't remove or suffer the errors

#include <string_view>

namespace klk {

/**
 * Parses a JSON document and converts it to T.
 * @tparam T The type to convert to, which must be convertible with boost::json::value_to.
 * @param json_str The JSON text.
 * @return The value, or the error code of the parse or conversion failure.
 */
template<typename T>
boost::system::result<T> parse_json(const std::string_view json_str) {
    boost::system::error_code ec;
    const auto jv = boost::json::parse(json_str, ec);
    if (ec) {
        return ec;
    }
    return boost::json::try_value_to<T>(jv);
}

}  // namespace klk
