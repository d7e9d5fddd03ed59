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

#include "keylightkit/core/assert.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <utility>

namespace klk {

/**
 * A reader writer lock built on a single atomic counter. Readers never block each other, a writer waits for all
 * readers to leave and announces itself so that no new readers get in.
 *
 * Acquiring is bounded: after k_loop_upper_bound attempts the lock gives up and returns an empty guard, so always check
 * the guard before touching the protected data.
 */
class AtomicRwLock {
  public:
    /// The max number of tries before giving up.
    static constexpr size_t k_loop_upper_bound = 1'000'000;

    /// The number of iterations after which a waiting thread starts yielding.
    static constexpr uint32_t k_yield_threshold = 10;

    /// The number of iterations after which a waiting thread starts sleeping.
    static constexpr uint32_t k_sleep_threshold = 10'000;

    /**
     * Holds on to a shared or exclusive lock until it goes out of scope. An empty guard holds nothing.
     */
    class Guard {
      public:
        Guard() = default;

        Guard(AtomicRwLock* lock, const bool exclusive) : lock_(lock), exclusive_(exclusive) {}

        ~Guard() {
            release();
        }

        Guard(const Guard& other) = delete;
        Guard& operator=(const Guard& other) = delete;

        Guard(Guard&& other) noexcept : lock_(std::exchange(other.lock_, nullptr)), exclusive_(other.exclusive_) {}

        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                lock_ = std::exchange(other.lock_, nullptr);
                exclusive_ = other.exclusive_;
            }
            return *this;
        }

        /// @returns True if this guard holds a lock, or false if it doesn't.
        explicit operator bool() const {
            return lock_ != nullptr;
        }

        /// @returns True if this guard holds the exclusive lock.
        [[nodiscard]] bool is_exclusive() const {
            return lock_ != nullptr && exclusive_;
        }

        /**
         * Releases the lock before the guard goes out of scope. Does nothing if the guard is empty.
         */
        void release() {
            if (lock_ == nullptr) {
                return;
            }
            if (exclusive_) {
                lock_->unlock_exclusive();
            } else {
                lock_->unlock_shared();
            }
            lock_ = nullptr;
        }

      private:
        AtomicRwLock* lock_ {};
        bool exclusive_ {};
    };

    AtomicRwLock() = default;

    AtomicRwLock(const AtomicRwLock&) = delete;
    AtomicRwLock& operator=(const AtomicRwLock&) = delete;

    AtomicRwLock(AtomicRwLock&&) = delete;
    AtomicRwLock& operator=(AtomicRwLock&&) = delete;

    /**
     * Acquires the exclusive lock, waiting for readers to leave.
     * Thread safe: yes
     * @return A guard which holds on to the lock as long as it's alive. Empty if the upper bound was reached.
     */
    [[nodiscard]] Guard lock_exclusive() {
        if (auto guard = try_lock_exclusive()) {
            return guard;
        }

        for (size_t i = 0; i < k_loop_upper_bound; ++i) {
            // Announce the writer so that no new readers come in.
            state_.fetch_or(k_writer_waiting_bit, std::memory_order_release);

            uint32_t expected = k_writer_waiting_bit;
            if (state_.compare_exchange_strong(expected, k_writer_bit, std::memory_order_acq_rel)) {
                return Guard(this, true);
            }

            back_off(i);
        }

        state_.fetch_and(~k_writer_waiting_bit, std::memory_order_release);
        KLK_ERROR("AtomicRwLock: loop upper bound reached while waiting for exclusive access");
        return {};
    }

    /**
     * Attempts to acquire the exclusive lock without waiting. Fails when anybody else holds the lock.
     * Thread safe: yes
     * @return A guard which holds on to the lock as long as it's alive. Empty if the lock could not be acquired.
     */
    [[nodiscard]] Guard try_lock_exclusive() {
        uint32_t expected = 0;
        if (state_.compare_exchange_strong(expected, k_writer_bit, std::memory_order_acq_rel)) {
            return Guard(this, true);
        }
        return {};
    }

    /**
     * Acquires a shared lock, waiting while a writer holds or waits for the lock.
     * Thread safe: yes
     * @return A guard which holds on to the lock as long as it's alive. Empty if the upper bound was reached.
     */
    [[nodiscard]] Guard lock_shared() {
        for (size_t i = 0; i < k_loop_upper_bound; ++i) {
            if (auto guard = try_lock_shared()) {
                return guard;
            }
            back_off(i);
        }
        KLK_ERROR("AtomicRwLock: loop upper bound reached while waiting for shared access");
        return {};
    }

    /**
     * Attempts to acquire a shared lock without waiting. Succeeds whenever no writer holds or waits for the lock.
     * Thread safe: yes
     * @return A guard which holds on to the lock as long as it's alive. Empty if the lock could not be acquired.
     */
    [[nodiscard]] Guard try_lock_shared() {
        if (state_.load(std::memory_order_acquire) >= k_readers_mask) {
            return {};
        }

        const auto prev = state_.fetch_add(1, std::memory_order_acq_rel);
        if (prev >= k_readers_mask) {
            state_.fetch_sub(1, std::memory_order_release);
            return {};
        }

        return Guard(this, false);
    }

    /**
     * @return True if locked shared. A relaxed snapshot, only useful for diagnostics and tests.
     */
    [[nodiscard]] bool is_locked_shared() const {
        return (state_.load(std::memory_order_relaxed) & k_readers_mask) > 0;
    }

    /**
     * @return True if locked exclusively. A relaxed snapshot, only useful for diagnostics and tests.
     */
    [[nodiscard]] bool is_locked_exclusively() const {
        return (state_.load(std::memory_order_relaxed) & k_writer_bit) != 0;
    }

    /**
     * @return True if locked in any way. A relaxed snapshot, only useful for diagnostics and tests.
     */
    [[nodiscard]] bool is_locked() const {
        return state_.load(std::memory_order_relaxed) > 0;
    }

  private:
    static constexpr uint32_t k_writer_bit = 1u << 30;
    static constexpr uint32_t k_writer_waiting_bit = 1u << 31;
    static constexpr uint32_t k_readers_mask = 0xFFFFFF;

    // Lower 24 bits count the readers, the upper bits flag the writer.
    std::atomic<uint32_t> state_ {0};

    static void back_off(const size_t iteration) {
        if (iteration >= k_sleep_threshold) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        } else if (iteration >= k_yield_threshold) {
            std::this_thread::yield();
        }
    }

    void unlock_exclusive() {
        const auto prev = state_.fetch_and(~k_writer_bit, std::memory_order_acq_rel);
        KLK_ASSERT_NO_THROW(prev & k_writer_bit, "Was not locked exclusively");
    }

    void unlock_shared() {
        const auto prev = state_.fetch_sub(1, std::memory_order_acq_rel);
        KLK_ASSERT_NO_THROW((prev & k_writer_bit) == 0, "Is locked exclusively");
        KLK_ASSERT_NO_THROW((prev & k_readers_mask) > 0, "Is not locked shared");
    }
};

}  // namespace klk
