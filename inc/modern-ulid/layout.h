// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_LAYOUT_H_INCLUDED
#define HEADER_MODERN_ULID_LAYOUT_H_INCLUDED

#include <modern-ulid/ulid.h>

#include <string>

namespace mulid {

    /**
     * Renders the binary layout of a ULID
     *
     * ```
     * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
     * |                      32_bit_uint_time_high                    |
     * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
     * |     16_bit_uint_time_low      |       16_bit_uint_random      |
     * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
     * |                       32_bit_uint_random                      |
     * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
     * |                       32_bit_uint_random                      |
     * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
     * ```
     * with each field printed as binary digits. Every line is terminated by `\n`.
     */
    MULID_EXPORTED auto format_layout(const ulid & val) -> std::string;
}

#endif
