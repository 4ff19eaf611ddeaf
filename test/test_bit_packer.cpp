// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <modern-ulid/bit_packer.h>

using namespace mulid::impl;
using namespace std::literals;

#define ARR(...) std::array<uint8_t, std::size({__VA_ARGS__})>{{__VA_ARGS__}}
#define SPN(...) std::span<const uint8_t, std::size({__VA_ARGS__})>(std::array<const uint8_t, std::size({__VA_ARGS__})>{{__VA_ARGS__}})


TEST_SUITE("bit_packer") {

static_assert(bit_packer<5, 16>::unpacked_bytes == 26);
static_assert(bit_packer<5, 16>::remainder == 3);
static_assert(bit_packer<5, 6>::unpacked_bytes == 10);
static_assert(bit_packer<5, 6>::remainder == 3);

TEST_CASE("5 bits short") {
    {
        auto dest = ARR(1);
        bit_packer<5, 1>::pack_bits(SPN(0x7, 0x1F), dest);
        CHECK_EQUAL_SEQ(dest, ARR(0xFF));

        auto src = ARR(1, 1);
        bit_packer<5, 1>::unpack_bits(std::span(dest), src);
        CHECK_EQUAL_SEQ(src, ARR(0x7, 0x1F));
    }
    {
        auto dest = ARR(1, 1);
        bit_packer<5, 2>::pack_bits(SPN(0x1, 0x1F, 0x1F, 0x1F), dest);
        CHECK_EQUAL_SEQ(dest, ARR(0xFF, 0xFF));

        auto src = ARR(1, 1, 1, 1);
        bit_packer<5, 2>::unpack_bits(std::span(dest), src);
        CHECK_EQUAL_SEQ(src, ARR(0x1, 0x1F, 0x1F, 0x1F));
    }
}

TEST_CASE("timestamp") {
    auto groups = ARR(0, 0, 0, 0, 0, 0, 0, 0, 0, 0);
    bit_packer<5, 6>::unpack_bits(SPN(0x01, 0x56, 0x3d, 0xf3, 0x64, 0x81), groups);
    CHECK_EQUAL_SEQ(groups, ARR(0, 1, 10, 24, 30, 31, 6, 25, 4, 1));

    auto bytes = ARR(0, 0, 0, 0, 0, 0);
    bit_packer<5, 6>::pack_bits(std::span<const uint8_t, 10>(groups), bytes);
    CHECK_EQUAL_SEQ(bytes, ARR(0x01, 0x56, 0x3d, 0xf3, 0x64, 0x81));

    bit_packer<5, 6>::unpack_bits(SPN(0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF), groups);
    CHECK_EQUAL_SEQ(groups, ARR(7, 31, 31, 31, 31, 31, 31, 31, 31, 31));
}

TEST_CASE("128 bits") {
    std::array<uint8_t, 26> groups{};
    bit_packer<5, 16>::unpack_bits(SPN(1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16), groups);
    CHECK_EQUAL_SEQ(groups, ARR(0, 1, 0, 8, 1, 16, 8, 1, 8, 6, 0, 28, 4, 0, 18, 2, 16, 11, 1, 16, 6, 16, 28, 3, 24, 16));

    std::array<uint8_t, 16> bytes{};
    bit_packer<5, 16>::pack_bits(std::span<const uint8_t, 26>(groups), bytes);
    CHECK_EQUAL_SEQ(bytes, ARR(1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16));
}

TEST_CASE("push and pop") {
    bit_packer<5, 16> packer;
    packer.push(7);
    for (int i = 0; i < 25; ++i)
        packer.push(31);

    std::array<uint8_t, 16> bytes{};
    packer.drain(bytes);
    for (auto b: bytes)
        CHECK(b == 0xFF);

    bit_packer<5, 16> reader{std::span<const uint8_t, 16>(bytes)};
    for (int i = 0; i < 25; ++i)
        CHECK(reader.pop() == 31);
    CHECK(reader.pop() == 7);
    CHECK(reader.pop() == 0);
}

TEST_CASE("constexpr") {
    constexpr auto packed = [] {
        std::array<uint8_t, 6> ret{};
        bit_packer<5, 6>::pack_bits(SPN(0, 1, 10, 24, 30, 31, 6, 25, 4, 1), ret);
        return ret;
    }();
    static_assert(packed == ARR(0x01, 0x56, 0x3d, 0xf3, 0x64, 0x81));
    CHECK(packed[0] == 0x01);
}

}
