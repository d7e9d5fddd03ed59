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

#include "exception.hpp"
#include "log.hpp"

#include <cstdlib>
#include <iostream>

/**
 * When KLK_LOG_ON_ASSERT is defined as true (1), a log message will be emitted when an assertion is hit. Default is on.
 */
#ifndef KLK_LOG_ON_ASSERT
    #define KLK_LOG_ON_ASSERT 1
#endif

/**
 * When KLK_THROW_EXCEPTION_ON_ASSERT is defined as true (1), an exception will be thrown when an assertion is hit.
 * Default is off. The test suite turns it on.
 */
#ifndef KLK_THROW_EXCEPTION_ON_ASSERT
    #define KLK_THROW_EXCEPTION_ON_ASSERT 0
#endif

/**
 * When KLK_ABORT_ON_ASSERT is defined as true (1), program execution will abort when an assertion is hit. Default is
 * off.
 */
#ifndef KLK_ABORT_ON_ASSERT
    #define KLK_ABORT_ON_ASSERT 0
#endif

#define KLK_LOG_IF_ENABLED(msg) \
    if (KLK_LOG_ON_ASSERT) {    \
        KLK_CRITICAL(msg);      \
    }

#define KLK_THROW_EXCEPTION_IF_ENABLED(msg) \
    if (KLK_THROW_EXCEPTION_ON_ASSERT) {    \
        KLK_THROW_EXCEPTION(msg);           \
    }

#define KLK_ABORT_IF_ENABLED(msg)                                  \
    if (KLK_ABORT_ON_ASSERT) {                                     \
        std::cerr << "Abort on assertion: " << (msg) << std::endl; \
        std::abort();                                              \
    }

/**
 * Assert condition to be true, otherwise logs, throws and/or aborts depending on configuration.
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 */
#define KLK_ASSERT(condition, message)                                    \
    do {                                                                  \
        if (!(condition)) {                                               \
            KLK_LOG_IF_ENABLED("Assertion failure: " message)             \
            KLK_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            KLK_ABORT_IF_ENABLED(message)                                 \
        }                                                                 \
    } while (false)

/**
 * Like KLK_ASSERT, but returns `return_value` from the calling function if `condition` is false.
 */
#define KLK_ASSERT_RETURN_WITH(condition, message, return_value)          \
    do {                                                                  \
        if (!(condition)) {                                               \
            KLK_LOG_IF_ENABLED("Assertion failure: " message)             \
            KLK_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            KLK_ABORT_IF_ENABLED(message)                                 \
            return return_value;                                          \
        }                                                                 \
    } while (false)

/**
 * Asserts given condition, but never throws. For places where an exception cannot be thrown like destructors.
 */
#define KLK_ASSERT_NO_THROW(condition, message)               \
    do {                                                      \
        if (!(condition)) {                                   \
            KLK_LOG_IF_ENABLED("Assertion failure: " message) \
            KLK_ABORT_IF_ENABLED(message)                     \
        }                                                     \
    } while (false)
