// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_ERROR_H_INCLUDED
#define HEADER_MODERN_ULID_ERROR_H_INCLUDED

#include <modern-ulid/common.h>

#include <system_error>
#include <type_traits>

namespace mulid {

    /**
     * Reasons a ULID operation can fail
     *
     * A value-initialized errc (`errc{}`) means success
     */
    enum class errc : int {
        /// Input to decode is not exactly 26 characters long
        invalid_length = 1,
        /// Input to decode contains a character outside of Crockford base32 alphabet
        invalid_character,
        /// Timestamp is negative or does not fit in 48 bits
        timestamp_out_of_range,
        /// Randomness is not exactly 10 bytes
        randomness_length,
        /// Incrementing randomness within the same millisecond would wrap around
        monotonic_overflow
    };

    /// Error category for errc values
    MULID_EXPORTED auto ulid_category() noexcept -> const std::error_category &;

    inline auto make_error_code(errc e) noexcept -> std::error_code {
        return std::error_code(int(e), ulid_category());
    }

    /// Exception thrown by operations that report errc failures
    class ulid_error : public std::system_error {
    public:
        ulid_error(errc e):
            std::system_error(make_error_code(e))
        {}
        ulid_error(errc e, const char * what_arg):
            std::system_error(make_error_code(e), what_arg)
        {}
    };

    namespace impl {
        [[noreturn]] inline void raise(errc e) {
            MULID_THROW(ulid_error(e));
        }
    }
}

template<>
struct std::is_error_code_enum<mulid::errc> : std::true_type {};

#endif
