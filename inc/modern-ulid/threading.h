// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_THREADING_H_INCLUDED
#define HEADER_MODERN_ULID_THREADING_H_INCLUDED

#include <modern-ulid/common.h>

#include <mutex>

namespace mulid::impl {

    //Lockable that never blocks, for single threaded builds
    class null_mutex {
    public:
        constexpr void lock() noexcept {}
        constexpr bool try_lock() noexcept { return true; }
        constexpr void unlock() noexcept {}
    };

#if MULID_MULTITHREADED
    using mutex_if_multithreaded = std::mutex;
#else
    using mutex_if_multithreaded = null_mutex;
#endif
}

#endif
