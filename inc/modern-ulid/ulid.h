// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_ULID_H_INCLUDED
#define HEADER_MODERN_ULID_ULID_H_INCLUDED

#include <modern-ulid/common.h>
#include <modern-ulid/error.h>
#include <modern-ulid/base32.h>

#include <string>

#include <fmt/format.h>

namespace mulid {

    class ulid {
    public:
        /// Whether to print ulid in lower or upper case
        using format = base32::format;
        static constexpr format lowercase = base32::lowercase;
        static constexpr format uppercase = base32::uppercase;

        /// Number of characters in string representation of ULID
        static constexpr size_t char_length = base32::encoded_length;
        /// Number of bytes of the timestamp part
        static constexpr size_t timestamp_size = 6;
        /// Number of bytes of the randomness part
        static constexpr size_t randomness_size = 10;

        using randomness_type = std::array<uint8_t, ulid::randomness_size>;
        using time_point_type = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    private:
        template<impl::char_like T, size_t Extent>
        static constexpr auto read(std::span<const T, Extent> src, std::span<uint8_t, 16> dest) noexcept -> errc {
            return base32::decode(src, dest);
        }

        template<impl::char_like T>
        static constexpr void write(std::span<const uint8_t, 16> src, T * str, format fmt) noexcept {
            base32::encode(src, std::span<T, ulid::char_length>(str, ulid::char_length), fmt);
        }

        template<impl::char_like T, size_t N>
        static constexpr auto literal_span(const T (&src)[N]) noexcept -> std::span<const T> {
            return std::span<const T>(src, (N > 0 && src[N - 1] == 0) ? N - 1 : N);
        }
    public:
        /// Big-endian storage. Bytes 0-5 are the timestamp, bytes 6-15 the randomness.
        std::array<uint8_t, 16> bytes{};

    public:
        ///Constructs a zeroed out (nil) ULID
        constexpr ulid() noexcept = default;

        ///Constructs ulid from a string literal
        template<impl::char_like T>
        consteval ulid(const T (&src)[ulid::char_length + 1]) noexcept {
            if (src[ulid::char_length] != 0 ||
                ulid::read(std::span<const T, ulid::char_length>(src, ulid::char_length), this->bytes) != errc{})
                impl::invalid_constexpr_call("invalid ulid string");
        }

        /// Constructs ulid from a span of 16 byte-like objects
        template<impl::byte_like Byte>
        constexpr ulid(std::span<Byte, 16> src) noexcept {
            std::transform(src.begin(), src.end(), this->bytes.data(), [](Byte b) { return uint8_t(b); });
        }

        /// Constructs ulid from anything convertible to a span of 16 byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
            requires decltype(std::span{x})::extent == 16;
        })
        constexpr ulid(const T & src) noexcept:
            ulid{std::span{src}}
        {}

        /**
         * Constructs ulid from a timestamp and randomness
         *
         * @param timestamp milliseconds since Unix epoch. Must be in [0, max_timestamp]
         * @param randomness exactly 10 bytes
         *
         * Throws ulid_error with errc::timestamp_out_of_range or errc::randomness_length
         */
        template<impl::byte_like Byte, size_t Extent>
        static constexpr auto from_parts(int64_t timestamp, std::span<Byte, Extent> randomness) -> ulid {
            if (timestamp < 0 || uint64_t(timestamp) > max_timestamp)
                impl::raise(errc::timestamp_out_of_range);
            if (randomness.size() != ulid::randomness_size)
                impl::raise(errc::randomness_length);
            ulid ret;
            auto * data = impl::write_bytes<ulid::timestamp_size>(uint64_t(timestamp), ret.bytes.data());
            std::transform(randomness.begin(), randomness.end(), data, [](Byte b) { return uint8_t(b); });
            return ret;
        }

        /// Constructs ulid from a timestamp and anything convertible to a span of byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto from_parts(int64_t timestamp, const T & randomness) -> ulid {
            return ulid::from_parts(timestamp, std::span{randomness});
        }

        /// Constructs ulid from a time point and randomness
        template<class Duration, class R>
        static auto from_parts(std::chrono::time_point<std::chrono::system_clock, Duration> when, const R & randomness) -> ulid {
            auto ms = std::chrono::floor<std::chrono::milliseconds>(when.time_since_epoch());
            return ulid::from_parts(int64_t(ms.count()), randomness);
        }

        /// Wraps an arbitrary 128-bit big-endian value
        static constexpr auto from_bytes(std::span<const uint8_t, 16> src) noexcept -> ulid {
            return ulid(src);
        }

        /// Returns a Max ULID
        static constexpr ulid max() noexcept
            { return ulid("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"); }

        /// Resets the object to a Nil ULID
        constexpr void clear() noexcept {
            *this = ulid();
        }

        /// Milliseconds since Unix epoch
        constexpr auto timestamp() const noexcept -> uint64_t {
            return impl::read_bytes<ulid::timestamp_size, uint64_t>(this->bytes.data());
        }

        /// Timestamp as a system_clock time point
        constexpr auto time_point() const noexcept -> time_point_type {
            return time_point_type(std::chrono::milliseconds(int64_t(this->timestamp())));
        }

        /// The 80 random bits
        constexpr auto randomness() const noexcept -> randomness_type {
            randomness_type ret;
            std::copy(this->bytes.begin() + ulid::timestamp_size, this->bytes.end(), ret.begin());
            return ret;
        }

        constexpr friend auto operator==(const ulid & lhs, const ulid & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const ulid & lhs, const ulid & rhs) noexcept -> std::strong_ordering = default;


        /// Parses ulid from a span of characters. Returns an empty optional on any failure.
        template<impl::char_like T, size_t Extent>
        static constexpr std::optional<ulid> from_chars(std::span<const T, Extent> src) noexcept {
            ulid ret;
            if (ulid::read(src, ret.bytes) != errc{})
                return std::nullopt;
            return ret;
        }

        /// Parses ulid from a character array. A trailing null character is ignored.
        template<impl::char_like T, size_t N>
        static constexpr std::optional<ulid> from_chars(const T (&src)[N]) noexcept
            { return ulid::from_chars(ulid::literal_span(src)); }

        /// Parses ulid from anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && !std::is_array_v<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto from_chars(const T & src) noexcept
            { return ulid::from_chars(std::span{src}); }


        /**
         * Parses ulid from a span of characters
         *
         * Throws ulid_error with errc::invalid_length, errc::invalid_character or
         * errc::timestamp_out_of_range
         */
        template<impl::char_like T, size_t Extent>
        static constexpr auto parse(std::span<const T, Extent> src) -> ulid {
            ulid ret;
            if (auto err = ulid::read(src, ret.bytes); err != errc{})
                impl::raise(err);
            return ret;
        }

        /// Parses ulid from a character array. A trailing null character is ignored.
        template<impl::char_like T, size_t N>
        static constexpr auto parse(const T (&src)[N]) -> ulid
            { return ulid::parse(ulid::literal_span(src)); }

        /// Parses ulid from anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && !std::is_array_v<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto parse(const T & src) -> ulid
            { return ulid::parse(std::span{src}); }


        /// Formats ulid into a span of characters
        template<impl::char_like T, size_t Extent>
        [[nodiscard]]
        constexpr auto to_chars(std::span<T, Extent> dest, format fmt = ulid::uppercase) const noexcept ->
            std::conditional_t<Extent == std::dynamic_extent, bool, void> {

            if constexpr (Extent == std::dynamic_extent) {
                if (dest.size() < ulid::char_length)
                    return false;
            } else {
                static_assert(Extent >= ulid::char_length, "destination is too small");
            }

            ulid::write(this->bytes, dest.data(), fmt);

            if constexpr (Extent == std::dynamic_extent)
                return true;
        }

        /// Formats ulid into anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto to_chars(T & dest, format fmt = ulid::uppercase) const noexcept {
            return this->to_chars(std::span{dest}, fmt);
        }

        /// Returns a character array with formatted ulid
        template<impl::char_like T = char>
        constexpr auto to_chars(format fmt = ulid::uppercase) const noexcept -> std::array<T, ulid::char_length> {
            std::array<T, ulid::char_length> ret;
            this->to_chars(ret, fmt);
            return ret;
        }


        template<impl::char_like T = char>
    #if __cpp_lib_constexpr_string >= 201907L
        constexpr
    #endif
        /// Returns a string with formatted ulid
        auto to_string(format fmt = ulid::uppercase) const -> std::basic_string<T>
        {
            std::basic_string<T> ret(ulid::char_length, T(0));
            (void)to_chars(ret, fmt);
            return ret;
        }

        /// Prints ulid into an ostream in canonical upper case
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const ulid val) {
            auto buf = val.to_chars<T>(ulid::uppercase);
            return str.write(buf.data(), std::streamsize(buf.size()));
        }

        /**
         * Reads ulid from an istream
         *
         * Leading whitespace is skipped. Exactly 26 characters are consumed. On failure
         * failbit is set and val is unchanged.
         */
        template<impl::char_like T>
        friend std::basic_istream<T> & operator>>(std::basic_istream<T> & str, ulid & val) {
            typename std::basic_istream<T>::sentry sentry(str);
            if (!sentry)
                return str;
            std::array<T, ulid::char_length> buf;
            if (!str.read(buf.data(), std::streamsize(buf.size())))
                return str;
            if (auto parsed = ulid::from_chars(std::span<const T, ulid::char_length>(buf)))
                val = *parsed;
            else
                str.setstate(std::ios_base::failbit);
            return str;
        }

        /// Returns hash code for the ulid
        friend constexpr size_t hash_value(const ulid & val) noexcept {
            static_assert(sizeof(ulid) % sizeof(size_t) == 0);
            size_t ret = 0;
            for (auto data = val.bytes.data(); data != val.bytes.data() + val.bytes.size(); data += sizeof(size_t))
                ret = impl::hash_combine(ret, impl::read_bytes<sizeof(size_t), size_t>(data));
            return ret;
        }
    };

    static_assert(sizeof(ulid) == 16);

    namespace impl {
        template<class Derived, class CharT>
        struct ulid_formatter_base {
            ulid::format fmt = ulid::uppercase;

            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
                using tr = format_spec_chars<CharT>;

                auto it = ctx.begin();
                while(it != ctx.end()) {
                    if (*it == tr::l) {
                        this->fmt = ulid::lowercase; ++it;
                    } else if (*it == tr::u) {
                        this->fmt = ulid::uppercase; ++it;
                    } else if (*it == tr::cl_br) {
                        break;
                    } else {
                        static_cast<Derived *>(this)->raise_exception("Invalid format args");
                    }
                }
                return it;
            }

            template <typename FormatContext>
            auto format(ulid val, FormatContext & ctx) const -> decltype(ctx.out())  {
                std::array<CharT, ulid::char_length> buf;
                val.to_chars(buf, this->fmt);
                return std::copy(buf.begin(), buf.end(), ctx.out());
            }
        };
    }
}

/// std::hash specialization for ulid
template<>
struct std::hash<mulid::ulid> {

    constexpr size_t operator()(const mulid::ulid & val) const noexcept {
        return hash_value(val);
    }
};


#if MULID_SUPPORTS_STD_FORMAT

/// ulid formatter for std::format
template<class CharT>
struct std::formatter<::mulid::ulid, CharT> :
    public ::mulid::impl::ulid_formatter_base<std::formatter<::mulid::ulid, CharT>, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        MULID_THROW(std::format_error(message));
    }
};

#endif

/// ulid formatter for fmt::format
template<class CharT>
struct fmt::formatter<::mulid::ulid, CharT> :
    public ::mulid::impl::ulid_formatter_base<fmt::formatter<::mulid::ulid, CharT>, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif
