// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_BIT_PACKER_H_INCLUDED
#define HEADER_MODERN_ULID_BIT_PACKER_H_INCLUDED

#include <modern-ulid/common.h>


namespace mulid::impl {

    /**
     * Multi-word shift register that converts between PackedBytes full octets and
     * a sequence of BitsPerByte-wide groups.
     *
     * Groups are ordered most significant first. When the total bit count is not a
     * multiple of BitsPerByte the first group is the short one.
     */
    template<size_t BitsPerByte, size_t PackedBytes>
    requires(BitsPerByte > 0 && BitsPerByte < 8 && PackedBytes > 0)
    class bit_packer {
    public:
        static constexpr size_t bits_per_byte = BitsPerByte;
        static constexpr size_t total_bits = PackedBytes * 8;
        static constexpr auto remainder = bit_packer::total_bits % BitsPerByte;
        static constexpr size_t unpacked_bytes = (bit_packer::total_bits / BitsPerByte) + (remainder != 0);
        static constexpr size_t packed_bytes = PackedBytes;

    private:
        static constexpr size_t word_bits = 64;
        static constexpr size_t words = (bit_packer::total_bits + word_bits - 1) / word_bits;

    public:
        constexpr bit_packer() noexcept = default;

        /// Loads packed_bytes octets, first one most significant
        template<class Byte>
        requires(std::is_same_v<std::remove_cv_t<Byte>, uint8_t>)
        constexpr bit_packer(std::span<Byte, bit_packer::packed_bytes> src) noexcept {
            for (uint8_t octet: src)
                this->shift_in(8, octet);
        }

        /// Stores the low packed_bytes octets, emptying the register
        constexpr void drain(std::span<uint8_t, bit_packer::packed_bytes> dst) noexcept {
            for (auto it = dst.rbegin(); it != dst.rend(); ++it)
                *it = uint8_t(this->shift_out(8));
        }

        /// Appends a group at the least significant end
        constexpr void push(uint8_t group) noexcept {
            this->shift_in(bit_packer::bits_per_byte, group);
        }

        /// Removes and returns the least significant group
        constexpr uint8_t pop() noexcept {
            return uint8_t(this->shift_out(bit_packer::bits_per_byte));
        }

        /// Packs unpacked_bytes groups into packed_bytes octets
        static constexpr void pack_bits(std::span<const uint8_t, bit_packer::unpacked_bytes> src,
                                        std::span<uint8_t, bit_packer::packed_bytes> dst) noexcept {
            bit_packer packer;
            for (uint8_t val: src)
                packer.push(val);
            packer.drain(dst);
        }

        /// Splits packed_bytes octets into unpacked_bytes groups
        static constexpr void unpack_bits(std::span<const uint8_t, bit_packer::packed_bytes> src,
                                          std::span<uint8_t, bit_packer::unpacked_bytes> dst) noexcept {
            bit_packer packer(src);
            for (auto it = dst.rbegin(); it != dst.rend(); ++it)
                *it = packer.pop();
        }

    private:
        //Shifts the whole register left by count bits filling the bottom with in.
        //Bits shifted out of the top word are discarded.
        constexpr void shift_in(size_t count, uint64_t in) noexcept {
            for (auto & word: m_words) {
                uint64_t out = word >> (word_bits - count);
                word = (word << count) | in;
                in = out;
            }
        }

        //Shifts the whole register right by count bits and returns the bits that fell off
        constexpr uint64_t shift_out(size_t count) noexcept {
            const uint64_t mask = (uint64_t(1) << count) - 1;
            uint64_t in = 0;
            for (auto it = m_words.rbegin(); it != m_words.rend(); ++it) {
                uint64_t out = *it & mask;
                *it = (*it >> count) | (in << (word_bits - count));
                in = out;
            }
            return in;
        }

    private:
        //least significant word first
        std::array<uint64_t, bit_packer::words> m_words{};
    };


}

#endif
