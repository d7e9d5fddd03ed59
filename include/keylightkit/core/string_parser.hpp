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

#include <optional>
#include <string_view>

namespace klk {

/**
 * A small utility class for taking strings apart. It works like a stream: it maintains a position in the string and
 * subsequent calls read from that position.
 *
 * The parser doesn't own the string, make sure the original string outlives the parser.
 */
class StringParser {
  public:
    /**
     * Constructs a parser from given string view.
     * @param str The string to parse.
     */
    explicit StringParser(const std::string_view str) : str_(str) {}

    /**
     * Reads a field up to the next delimiter and consumes the delimiter. The last field is whatever follows the last
     * delimiter, so "a;" yields "a" and then "", and an empty string yields a single empty field.
     * @param delimiter The delimiter between fields.
     * @return The field, or an empty optional when all fields have been read.
     */
    std::optional<std::string_view> split(const char delimiter) {
        if (exhausted_) {
            return std::nullopt;
        }

        const auto pos = str_.find(delimiter);
        if (pos == std::string_view::npos) {
            const auto field = str_;
            str_ = {};
            exhausted_ = true;
            return field;
        }

        const auto field = str_.substr(0, pos);
        str_.remove_prefix(pos + 1);
        return field;
    }

    /**
     * Reads a line. A line is terminated by a newline character or by the end of the string. A trailing CR (from CRLF)
     * is removed. The end of the string does not produce an extra empty line.
     * @returns The line, or an empty optional when there is nothing left.
     */
    std::optional<std::string_view> read_line() {
        if (exhausted_ || str_.empty()) {
            exhausted_ = true;
            return std::nullopt;
        }

        auto line = str_;
        const auto pos = str_.find('\n');
        if (pos == std::string_view::npos) {
            str_ = {};
            exhausted_ = true;
        } else {
            line = str_.substr(0, pos);
            str_.remove_prefix(pos + 1);
        }

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        return line;
    }

    /**
     * @return True if the string is exhausted, or false otherwise.
     */
    [[nodiscard]] bool exhausted() const {
        return exhausted_;
    }

  private:
    std::string_view str_;
    bool exhausted_ {false};
};

}  // namespace klk
