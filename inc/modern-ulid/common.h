// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_COMMON_H_INCLUDED
#define HEADER_MODERN_ULID_COMMON_H_INCLUDED

// Configuration macros. Define them identically for the library and its users:
//
// MULID_MULTITHREADED  - 1 or 0. Auto-detected when not defined.
//                        Selects the mutex used by synchronized_generator.
// MULID_USE_EXCEPTIONS - 1 or 0. Auto-detected when not defined.
//                        When 0 errors print a message and abort.
// MULID_SHARED         - 1 when the library is built as a shared library.
//
// MULID_BUILDING_MULID is set only while compiling the library itself.

#include <cstdint>
#include <cstring>
#include <cstdio>
#include <cstdlib>

#include <version>
#include <concepts>
#include <compare>
#include <array>
#include <span>
#include <string_view>
#include <optional>
#include <limits>
#include <chrono>
#include <istream>
#include <ostream>

#ifndef MULID_MULTITHREADED
    #if !__has_include(<mutex>) || defined(_LIBCPP_HAS_NO_THREADS) || (defined(__GLIBCXX__) && !_GLIBCXX_HAS_GTHREADS)
        #define MULID_MULTITHREADED 0
    #else
        #define MULID_MULTITHREADED 1
    #endif
#endif

#ifndef MULID_USE_EXCEPTIONS
    #if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || (defined(_MSC_VER) && _HAS_EXCEPTIONS)
        #define MULID_USE_EXCEPTIONS 1
    #else
        #define MULID_USE_EXCEPTIONS 0
    #endif
#endif

#if !MULID_SHARED
    #define MULID_EXPORTED
#elif defined(_WIN32) && MULID_BUILDING_MULID
    #define MULID_EXPORTED __declspec(dllexport)
#elif defined(_WIN32)
    #define MULID_EXPORTED __declspec(dllimport)
#elif defined(__GNUC__)
    #define MULID_EXPORTED [[gnu::visibility("default")]]
#else
    #define MULID_EXPORTED
#endif

//libc++ before 17 ships a usable <format> without defining __cpp_lib_format
#if __has_include(<format>) && (defined(__cpp_lib_format) || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 170000))
    #define MULID_SUPPORTS_STD_FORMAT 1
    #include <format>
#else
    #define MULID_SUPPORTS_STD_FORMAT 0
#endif

namespace mulid
{
    namespace impl {
        template<class T>
        struct span_detector : std::false_type {};
        template<class T, size_t Extent>
        struct span_detector<std::span<T, Extent>> : std::true_type {};

        template<class T>
        constexpr bool is_span = span_detector<std::remove_cv_t<T>>::value;

        template<class T>
        concept byte_like = std::is_standard_layout_v<T> &&
                            sizeof(T) == sizeof(uint8_t) &&
        requires {
            static_cast<T>(uint8_t{});
            static_cast<uint8_t>(T{});
        };

        static_assert(byte_like<char>);
        static_assert(byte_like<unsigned char>);
        static_assert(byte_like<signed char>);
        static_assert(byte_like<std::byte>);

        template<class T>
        concept char_like = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                            std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

        void invalid_constexpr_call(const char *);

        #if MULID_USE_EXCEPTIONS
            #define MULID_THROW(x) throw x
        #else
            [[noreturn]] inline void fail(const char* message) {
                fprintf(stderr, "mulid: fatal error: %s", message);
                abort();
            }
            #define MULID_THROW(x) ::mulid::impl::fail((x).what())
        #endif

        template<std::same_as<size_t> S>
        constexpr size_t hash_combine(S prev, S next) noexcept {
            constexpr auto digits = std::numeric_limits<S>::digits;
            static_assert(digits == 64 || digits == 32);

            S x = prev + 0x9e3779b9 + next;
            if constexpr (digits == 64) {
                const S m = 0xe9846af9b1a615d;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 28;
            } else {
                const S m1 = 0x21f0aaad;
                const S m2 = 0x735a2d97;
                x ^= x >> 16;
                x *= m1;
                x ^= x >> 15;
                x *= m2;
                x ^= x >> 15;
            }
            return x;
        }

        //Writes the low Count bytes of val in big-endian order
        template<size_t Count, impl::byte_like Byte, std::unsigned_integral T>
        requires(Count > 0 && Count <= sizeof(T))
        constexpr Byte * write_bytes(T val, Byte * bytes) noexcept {
            for(size_t i = Count; i != 0; --i) {
                bytes[i - 1] = Byte(static_cast<uint8_t>(val));
                if constexpr (Count > 1)
                    val >>= 8;
            }
            return bytes + Count;
        }

        //Reads Count big-endian bytes into the low bytes of a T
        template<size_t Count, std::unsigned_integral T, impl::byte_like Byte>
        requires(Count > 0 && Count <= sizeof(T))
        constexpr T read_bytes(const Byte * bytes) noexcept {
            T ret = 0;
            for(size_t i = 0; i < Count; ++i) {
                if constexpr (Count > 1)
                    ret <<= 8;
                ret |= uint8_t(bytes[i]);
            }
            return ret;
        }
    }
}

#endif
