// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_SOURCES_H_INCLUDED
#define HEADER_MODERN_ULID_SOURCES_H_INCLUDED

#include <modern-ulid/common.h>

#include <memory>

namespace mulid {

    /**
     * Callback interface that supplies the current time to ULID generators
     *
     * Readings are expected to be non-decreasing most of the time but
     * generators tolerate backward jumps.
     */
    class time_source {
    public:
        virtual ~time_source() noexcept = default;

        /// Returns milliseconds since Unix epoch
        virtual auto now() -> int64_t = 0;

    protected:
        time_source() noexcept = default;
        time_source(const time_source &) noexcept = default;
        time_source & operator=(const time_source &) noexcept = default;
    };

    /**
     * Callback interface that supplies random bytes to ULID generators
     *
     * Implementations must produce uniformly distributed bytes. Cryptographic
     * strength is not required.
     */
    class random_source {
    public:
        virtual ~random_source() noexcept = default;

        /// Fills all of dest with random bytes
        virtual void fill(std::span<uint8_t> dest) = 0;

    protected:
        random_source() noexcept = default;
        random_source(const random_source &) noexcept = default;
        random_source & operator=(const random_source &) noexcept = default;
    };

    /// Reads std::chrono::system_clock truncated to milliseconds
    class system_time_source final : public time_source {
    public:
        MULID_EXPORTED auto now() -> int64_t override;
    };

    /// Always returns the same timestamp
    class fixed_time_source final : public time_source {
    public:
        explicit fixed_time_source(int64_t timestamp) noexcept:
            m_timestamp(timestamp)
        {}

        auto now() -> int64_t override
            { return m_timestamp; }

    private:
        int64_t m_timestamp;
    };

    /**
     * Creates the default random source: a ChaCha20/12 stream seeded from system entropy.
     *
     * The returned source is safe to use from multiple threads. It draws from a per-thread
     * engine which is reseeded in the child process after fork().
     */
    MULID_EXPORTED auto make_default_random_source() -> std::unique_ptr<random_source>;

}

#endif
