// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/generator.h>
#include <modern-ulid/logging.h>

#include <spdlog/spdlog.h>

using namespace mulid;

static void check_timestamp(int64_t timestamp) {
    if (timestamp < 0 || uint64_t(timestamp) > max_timestamp)
        impl::raise(errc::timestamp_out_of_range);
}

static void log_generated(const char * kind, const ulid & val) {
    auto logger = get_logger();
    if (!logger->should_log(spdlog::level::trace))
        return;
    auto random = val.randomness();
    auto high = impl::read_bytes<2, uint16_t>(random.data());
    auto low = impl::read_bytes<8, uint64_t>(random.data() + 2);
    logger->trace("{} {}: time {:048b} random {:016b}{:064b}", kind, val.to_string(), val.timestamp(), high, low);
}

generator::generator():
    generator(nullptr, nullptr)
{}

generator::generator(int64_t fixed_timestamp):
    generator((check_timestamp(fixed_timestamp), std::make_unique<fixed_time_source>(fixed_timestamp)), nullptr)
{}

generator::generator(std::unique_ptr<time_source> clock, std::unique_ptr<random_source> random):
    m_clock(clock ? std::move(clock) : std::make_unique<system_time_source>()),
    m_random(random ? std::move(random) : make_default_random_source())
{}

auto generator::generate() const -> ulid {
    int64_t now = m_clock->now();
    ulid::randomness_type random;
    m_random->fill(random);
    auto ret = ulid::from_parts(now, random);
    log_generated("generated", ret);
    return ret;
}


monotonic_generator::monotonic_generator():
    monotonic_generator(nullptr, nullptr)
{}

monotonic_generator::monotonic_generator(int64_t fixed_timestamp):
    monotonic_generator((check_timestamp(fixed_timestamp), std::make_unique<fixed_time_source>(fixed_timestamp)), nullptr)
{}

monotonic_generator::monotonic_generator(std::unique_ptr<time_source> clock, std::unique_ptr<random_source> random):
    m_clock(clock ? std::move(clock) : std::make_unique<system_time_source>()),
    m_random(random ? std::move(random) : make_default_random_source())
{}

auto monotonic_generator::generate() -> ulid {
    int64_t now = m_clock->now();
    check_timestamp(now);

    tail_t tail;
    if (m_tracking && now == m_last_time) {
        tail = m_tail;
        if (!tail.increment()) {
            get_logger()->warn("monotonic overflow: randomness exhausted within millisecond {}", now);
            impl::raise(errc::monotonic_overflow);
        }
    } else {
        if (m_tracking && now < m_last_time) {
            //we lost monotonicity
            //start afresh from the new millisecond
            get_logger()->debug("clock moved backwards from {} to {}, drawing new randomness", m_last_time, now);
        }
        ulid::randomness_type random;
        m_random->fill(random);
        tail.high = impl::read_bytes<2, uint16_t>(random.data());
        tail.low = impl::read_bytes<8, uint64_t>(random.data() + 2);
    }

    ulid::randomness_type buf;
    auto data = buf.data();
    data = impl::write_bytes<2>(tail.high, data);
    impl::write_bytes<8>(tail.low, data);
    auto ret = ulid::from_parts(now, buf);

    m_tracking = true;
    m_last_time = now;
    m_tail = tail;

    log_generated("generated monotonic", ret);
    return ret;
}

auto monotonic_generator::last() const noexcept -> ulid {
    if (!m_tracking)
        return ulid();
    std::array<uint8_t, 16> buf;
    auto data = buf.data();
    data = impl::write_bytes<ulid::timestamp_size>(uint64_t(m_last_time), data);
    data = impl::write_bytes<2>(m_tail.high, data);
    impl::write_bytes<8>(m_tail.low, data);
    return ulid(buf);
}

void monotonic_generator::resume(const ulid & last) noexcept {
    auto random = last.randomness();
    m_last_time = int64_t(last.timestamp());
    m_tail.high = impl::read_bytes<2, uint16_t>(random.data());
    m_tail.low = impl::read_bytes<8, uint64_t>(random.data() + 2);
    m_tracking = true;
}
