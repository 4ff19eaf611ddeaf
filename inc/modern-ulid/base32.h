// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_BASE32_H_INCLUDED
#define HEADER_MODERN_ULID_BASE32_H_INCLUDED

#include <modern-ulid/common.h>
#include <modern-ulid/error.h>
#include <modern-ulid/bit_packer.h>

#include <algorithm>

namespace mulid {

    /// Largest timestamp (in milliseconds since Unix epoch) a ULID can hold. Year 10889.
    inline constexpr uint64_t max_timestamp = (uint64_t(1) << 48) - 1;

    namespace impl {
        //Characters recognized in ulid format specs: {:l} and {:u}
        template<char_like C> struct format_spec_chars {
            static constexpr C l = C(u8'l');
            static constexpr C u = C(u8'u');
            static constexpr C cl_br = C(u8'}');
        };

        template<> struct format_spec_chars<char> {
            static constexpr char l = 'l';
            static constexpr char u = 'u';
            static constexpr char cl_br = '}';
        };

        template<> struct format_spec_chars<wchar_t> {
            static constexpr wchar_t l = L'l';
            static constexpr wchar_t u = L'u';
            static constexpr wchar_t cl_br = L'}';
        };

        //Digits for values 0-31 in lower case followed by the same in upper case
        template<char_like C>
        constexpr auto base32_digits() noexcept -> const C * {
            if constexpr (std::is_same_v<C, char>)
                return "0123456789abcdefghjkmnpqrstvwxyz" "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
            else if constexpr (std::is_same_v<C, wchar_t>)
                return L"0123456789abcdefghjkmnpqrstvwxyz" L"0123456789ABCDEFGHJKMNPQRSTVWXYZ";
            else if constexpr (std::is_same_v<C, char8_t>)
                return u8"0123456789abcdefghjkmnpqrstvwxyz" u8"0123456789ABCDEFGHJKMNPQRSTVWXYZ";
            else if constexpr (std::is_same_v<C, char16_t>)
                return u"0123456789abcdefghjkmnpqrstvwxyz" u"0123456789ABCDEFGHJKMNPQRSTVWXYZ";
            else
                return U"0123456789abcdefghjkmnpqrstvwxyz" U"0123456789ABCDEFGHJKMNPQRSTVWXYZ";
        }

        inline constexpr uint8_t base32_radix = 32;

        //Maps code units below 256 to digit values. Everything else (including I, L, O and U)
        //maps to base32_radix.
        template<char_like C>
        consteval auto make_reverse_base32_alphabet() {
            std::array<uint8_t, 256> ret;
            ret.fill(base32_radix);
            const C * digits = base32_digits<C>();
            for (uint8_t i = 0; i < 2 * base32_radix; ++i)
                ret[std::make_unsigned_t<C>(digits[i])] = i % base32_radix;
            return ret;
        }

        template<char_like C>
        class base32_alphabet {
        private:
            using code_unit = std::make_unsigned_t<C>;

            static constexpr auto reverse = make_reverse_base32_alphabet<C>();

        public:
            static constexpr C encode(bool uppercase, uint8_t val) noexcept {
                return base32_digits<C>()[val + (uppercase ? base32_radix : 0)];
            }

            //Returns base32_radix for characters outside of the alphabet
            static constexpr uint8_t decode(C c) noexcept {
                auto code = code_unit(c);
                if (code >= reverse.size())
                    return base32_radix;
                return reverse[code];
            }
        };
    }

    /**
     * Crockford base32 codec for 128-bit ULID values
     *
     * Values are 16 bytes in big-endian order. The text form is 26 characters, most
     * significant first. The first character only carries 3 bits so it is always in
     * the `0`-`7` range.
     */
    namespace base32 {

        /// Whether to produce lower or upper case letters
        enum format {
            lowercase,
            uppercase
        };

        /// Number of characters in an encoded 128-bit value
        inline constexpr size_t encoded_length = 26;
        /// Number of characters in an encoded 48-bit timestamp
        inline constexpr size_t timestamp_length = 10;

        template<impl::char_like T>
        constexpr void encode(std::span<const uint8_t, 16> src, std::span<T, encoded_length> dest,
                              format fmt = uppercase) noexcept {
            impl::bit_packer<5, 16> packer(src);
            for (size_t i = encoded_length; i != 0; --i) {
                uint8_t val = packer.pop();
                dest[i - 1] = impl::base32_alphabet<T>::encode(fmt, val);
            }
        }

        template<impl::char_like T = char>
        constexpr auto encode(std::span<const uint8_t, 16> src, format fmt = uppercase) noexcept -> std::array<T, encoded_length> {
            std::array<T, encoded_length> ret;
            base32::encode(src, std::span<T, encoded_length>(ret), fmt);
            return ret;
        }

        /**
         * Decodes 26 characters into 16 bytes
         *
         * Decoding is case insensitive. `dest` is only modified on success.
         *
         * @returns `errc{}` on success
         *  - errc::invalid_length if src is not exactly 26 characters
         *  - errc::invalid_character if src contains anything outside of the alphabet
         *  - errc::timestamp_out_of_range if the first character is above `7`
         */
        template<impl::char_like T, size_t Extent>
        constexpr auto decode(std::span<const T, Extent> src, std::span<uint8_t, 16> dest) noexcept -> errc {
            if (src.size() != encoded_length)
                return errc::invalid_length;

            impl::bit_packer<5, 16> packer;
            uint8_t first = 0;
            for(size_t i = 0; i < encoded_length; ++i) {
                uint8_t val = impl::base32_alphabet<T>::decode(src[i]);
                if (val >= impl::base32_radix)
                    return errc::invalid_character;
                if (i == 0)
                    first = val;
                packer.push(val);
            }
            if (first > 7)
                return errc::timestamp_out_of_range;
            packer.drain(dest);
            return errc{};
        }

        /**
         * Encodes a 48-bit timestamp into 10 characters
         *
         * @returns `errc{}` on success or errc::timestamp_out_of_range if timestamp exceeds
         * max_timestamp. `dest` is not modified on failure.
         */
        template<impl::char_like T>
        constexpr auto encode_timestamp(uint64_t timestamp, std::span<T, timestamp_length> dest,
                                        format fmt = uppercase) noexcept -> errc {
            if (timestamp > max_timestamp)
                return errc::timestamp_out_of_range;

            std::array<uint8_t, 6> bytes;
            impl::write_bytes<6>(timestamp, bytes.data());
            impl::bit_packer<5, 6> packer{std::span<const uint8_t, 6>(bytes)};
            for (size_t i = timestamp_length; i != 0; --i) {
                uint8_t val = packer.pop();
                dest[i - 1] = impl::base32_alphabet<T>::encode(fmt, val);
            }
            return errc{};
        }

        /// Encodes a 48-bit timestamp into 10 characters. Throws ulid_error on failure.
        template<impl::char_like T = char>
        constexpr auto encode_timestamp(uint64_t timestamp, format fmt = uppercase) -> std::array<T, timestamp_length> {
            std::array<T, timestamp_length> ret;
            if (auto err = base32::encode_timestamp(timestamp, std::span<T, timestamp_length>(ret), fmt); err != errc{})
                impl::raise(err);
            return ret;
        }
    }
}

#endif
