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

#include <fmt/format.h>

#include <exception>
#include <string>

/**
 * Throws a klk::Exception with a message formatted by fmt, annotated with the current file, line and function.
 */
#define KLK_THROW_EXCEPTION(...) \
    throw klk::Exception(fmt::format(__VA_ARGS__), __FILE__, __LINE__, static_cast<const char*>(__func__))

namespace klk {

class Exception: public std::exception {
  public:
    explicit
    Exception(std::string msg, const char* file = nullptr, const int line = -1, const char* function_name = nullptr) :
        error_(std::move(msg)), file_(file), line_(line), function_name_(function_name) {}

    /**
     * @returns The message of this exception.
     */
    [[nodiscard]] const char* what() const noexcept override {
        return error_.c_str();
    }

    /**
     * @return The file where the exception was thrown, or nullptr when unknown.
     */
    [[nodiscard]] const char* file() const {
        return file_;
    }

    /**
     * @return The line where the exception was thrown, or -1 when unknown.
     */
    [[nodiscard]] int line() const {
        return line_;
    }

    /**
     * @return The name of the function which threw, or nullptr when unknown.
     */
    [[nodiscard]] const char* function_name() const {
        return function_name_;
    }

  private:
    std::string error_;
    const char* file_ {};
    int line_ {};
    const char* function_name_ {};
};

}  // namespace klk
