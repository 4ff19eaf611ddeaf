// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_FORK_HANDLER_H_INCLUDED
#define HEADER_MODERN_ULID_FORK_HANDLER_H_INCLUDED

#include <modern-ulid/common.h>

#if __has_include(<unistd.h>) && __has_include(<pthread.h>)
    #include <unistd.h>
    #include <pthread.h>
    #include <signal.h>

    #define MULID_HANDLE_FORK 1
#else
    #define MULID_HANDLE_FORK 0
#endif

#include <optional>
#include <system_error>
#include <type_traits>

namespace mulid::impl {

#if MULID_HANDLE_FORK

    /**
     * Process generation counter
     *
     * Incremented in the child after every fork() so that per-thread state
     * inherited from the parent can tell it is stale.
     */
    class fork_generation {
    public:
        using counter = std::make_unsigned_t<sig_atomic_t>;

        static counter current() {
            [[maybe_unused]]
            static const int registered = []() {
                if (int res = pthread_atfork(nullptr, nullptr, after_fork_in_child); res != 0)
                    throw std::system_error(res, std::system_category(), "pthread_atfork");
                return 1;
            }();
            return s_value;
        }

    private:
        static void after_fork_in_child() {
            //only async signal safe operations here
            s_value = s_value + 1;
        }

        static inline volatile counter s_value = 0;
    };

    /**
     * Lazily constructed instance of T, one per thread
     *
     * The child of a fork() gets a freshly constructed T on first use instead of
     * a copy of the parent's.
     */
    template<class T>
    class per_thread_instance {
    public:
        static T & get() {
            auto generation = fork_generation::current();
            if (!t_slot.obj || t_slot.generation != generation) {
                t_slot.obj.emplace();
                t_slot.generation = generation;
            }
            return *t_slot.obj;
        }

    private:
        struct slot {
            std::optional<T> obj;
            fork_generation::counter generation = 0;
        };
        static thread_local inline slot t_slot{};
    };

#else

    template<class T>
    class per_thread_instance {
    public:
        static T & get() {
            thread_local T obj;
            return obj;
        }
    };

#endif

}

#endif
