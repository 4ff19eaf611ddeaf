// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/layout.h>

#include <fmt/format.h>

using namespace mulid;

auto mulid::format_layout(const ulid & val) -> std::string {
    constexpr std::string_view interval = "+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+";

    auto data = val.bytes.data();
    auto time_high = impl::read_bytes<4, uint32_t>(data);
    auto time_low = impl::read_bytes<2, uint16_t>(data + 4);
    auto random_high = impl::read_bytes<2, uint16_t>(data + 6);
    auto random_mid = impl::read_bytes<4, uint32_t>(data + 8);
    auto random_low = impl::read_bytes<4, uint32_t>(data + 12);

    return fmt::format("{0}\n"
                       "|{1:16}{2:032b}{1:15}|\n"
                       "{0}\n"
                       "|{1:8}{3:016b}{1:7}|{1:8}{4:016b}{1:7}|\n"
                       "{0}\n"
                       "|{1:16}{5:032b}{1:15}|\n"
                       "{0}\n"
                       "|{1:16}{6:032b}{1:15}|\n"
                       "{0}\n",
                       interval, "", time_high, time_low, random_high, random_mid, random_low);
}
