// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/error.h>

#include <string>

using namespace mulid;

namespace {

    class ulid_category_impl final : public std::error_category {
    public:
        const char * name() const noexcept override {
            return "ulid";
        }

        std::string message(int code) const override {
            switch (errc(code)) {
            case errc::invalid_length:
                return "ulid string must be exactly 26 characters long";
            case errc::invalid_character:
                return "invalid character in ulid string";
            case errc::timestamp_out_of_range:
                return "ulid timestamp must be in the range [0, 2^48 - 1]";
            case errc::randomness_length:
                return "ulid randomness must be exactly 10 bytes";
            case errc::monotonic_overflow:
                return "ulid randomness overflowed within the same millisecond";
            }
            return "unknown ulid error";
        }
    };
}

auto mulid::ulid_category() noexcept -> const std::error_category & {
    static const ulid_category_impl instance;
    return instance;
}
