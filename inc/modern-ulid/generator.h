// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_GENERATOR_H_INCLUDED
#define HEADER_MODERN_ULID_GENERATOR_H_INCLUDED

#include <modern-ulid/ulid.h>
#include <modern-ulid/sources.h>
#include <modern-ulid/threading.h>

#include <memory>
#include <limits>
#include <utility>

namespace mulid {

    /// Anything that produces ULIDs via `generate()`
    template<class G>
    concept ulid_generator = requires(G & gen) {
        { gen.generate() } -> std::same_as<ulid>;
    };

    /**
     * Generates ULIDs with fresh randomness on every call
     *
     * Holds no mutable state. With the default sources a single instance can be used
     * from multiple threads concurrently. User supplied sources must be thread safe
     * for the same to hold.
     */
    class generator {
    public:
        /// Uses the system clock and the default random source
        MULID_EXPORTED generator();

        /**
         * Uses a fixed timestamp for every generated ULID and the default random source
         *
         * Throws ulid_error with errc::timestamp_out_of_range if timestamp is negative or
         * exceeds max_timestamp
         */
        MULID_EXPORTED explicit generator(int64_t fixed_timestamp);

        /**
         * Uses the supplied sources
         *
         * A null source is replaced with the corresponding default one.
         */
        MULID_EXPORTED generator(std::unique_ptr<time_source> clock, std::unique_ptr<random_source> random);

        generator(generator &&) noexcept = default;
        generator & operator=(generator &&) noexcept = default;

        /// Generates a new ULID
        MULID_EXPORTED auto generate() const -> ulid;

    private:
        std::unique_ptr<time_source> m_clock;
        std::unique_ptr<random_source> m_random;
    };

    /**
     * Generates strictly increasing ULIDs
     *
     * When called repeatedly within the same millisecond the randomness of the previous
     * ULID is incremented by 1 instead of being redrawn. If the clock moves backwards
     * the generator starts afresh from the new millisecond so ordering is only preserved
     * within each millisecond.
     *
     * The state is not synchronized. Sharing a single instance among threads requires
     * external locking (see synchronized_generator).
     */
    class monotonic_generator {
    public:
        /// Uses the system clock and the default random source
        MULID_EXPORTED monotonic_generator();

        /**
         * Uses a fixed timestamp for every generated ULID and the default random source
         *
         * Throws ulid_error with errc::timestamp_out_of_range if timestamp is negative or
         * exceeds max_timestamp
         */
        MULID_EXPORTED explicit monotonic_generator(int64_t fixed_timestamp);

        /**
         * Uses the supplied sources
         *
         * A null source is replaced with the corresponding default one.
         */
        MULID_EXPORTED monotonic_generator(std::unique_ptr<time_source> clock, std::unique_ptr<random_source> random);

        monotonic_generator(monotonic_generator &&) noexcept = default;
        monotonic_generator & operator=(monotonic_generator &&) noexcept = default;

        /**
         * Generates a new ULID greater than any previously generated in the same millisecond
         *
         * Throws ulid_error with errc::monotonic_overflow if the previous randomness is already
         * all ones and the millisecond has not changed. The state is left untouched in this case
         * so the next call in a later millisecond succeeds.
         */
        MULID_EXPORTED auto generate() -> ulid;

        /// The last generated ULID or a nil one if nothing has been generated yet
        MULID_EXPORTED auto last() const noexcept -> ulid;

        /// Continues the sequence from a previously generated ULID
        MULID_EXPORTED void resume(const ulid & last) noexcept;

    private:
        struct tail_t {
            uint64_t low = 0;
            uint16_t high = 0;

            bool increment() noexcept {
                if (this->low == std::numeric_limits<uint64_t>::max() &&
                    this->high == std::numeric_limits<uint16_t>::max())
                    return false;
                if (++this->low == 0)
                    ++this->high;
                return true;
            }
        };

    private:
        std::unique_ptr<time_source> m_clock;
        std::unique_ptr<random_source> m_random;
        bool m_tracking = false;
        int64_t m_last_time = 0;
        tail_t m_tail;
    };

    /**
     * Serializes generate() calls of the wrapped generator with a mutex
     *
     * When the library is built without thread support the mutex is a no-op.
     */
    template<ulid_generator G>
    class synchronized_generator {
    public:
        template<class... Args>
        requires(std::is_constructible_v<G, Args &&...>)
        explicit synchronized_generator(Args &&... args):
            m_generator(std::forward<Args>(args)...)
        {}

        synchronized_generator(const synchronized_generator &) = delete;
        synchronized_generator & operator=(const synchronized_generator &) = delete;

        auto generate() -> ulid {
            std::lock_guard guard{m_mutex};
            return m_generator.generate();
        }

    private:
        impl::mutex_if_multithreaded m_mutex;
        G m_generator;
    };

    static_assert(ulid_generator<generator>);
    static_assert(ulid_generator<monotonic_generator>);
    static_assert(ulid_generator<synchronized_generator<monotonic_generator>>);
}

#endif
