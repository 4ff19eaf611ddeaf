// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <doctest/doctest.h>

#include <modern-ulid/layout.h>

using namespace mulid;
using namespace std::literals;

TEST_SUITE("layout") {

TEST_CASE("value") {
    auto expected =
        "+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+\n"
        "|                00000001010111110100101111111111               |\n"
        "+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+\n"
        "|        1100110101110011       |        0101001100110100       |\n"
        "+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+\n"
        "|                10101101101001111000111011011100               |\n"
        "+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+\n"
        "|                00011101010010100110111100011110               |\n"
        "+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+\n"s;

    CHECK(format_layout(ulid("01BX5ZZKBKACTAV9WEVGEMMVRY")) == expected);
}

TEST_CASE("nil") {
    auto text = format_layout(ulid());
    CHECK(text.size() == 9 * 66);
    CHECK(text.find('1') == std::string::npos);
    CHECK(text.back() == '\n');
}

TEST_CASE("max") {
    auto text = format_layout(ulid::max());
    size_t ones = 0;
    for (char c: text)
        ones += (c == '1');
    CHECK(ones == 128);
    CHECK(text.find("|        1111111111111111       |        1111111111111111       |\n") != std::string::npos);
}

}
