// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <modern-ulid/generator.h>
#include <modern-ulid/logging.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <cstdlib>

#include <sstream>

using namespace mulid;
using namespace std::literals;

namespace {
    //Captures library output and puts the previous logger back on exit
    class capture_log {
    public:
        capture_log(spdlog::level::level_enum level = spdlog::level::trace):
            m_saved(get_logger())
        {
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(m_stream);
            auto logger = std::make_shared<spdlog::logger>("mulid-capture", sink);
            logger->set_pattern("%l %v");
            logger->set_level(level);
            set_logger(logger);
        }
        ~capture_log() {
            set_logger(m_saved);
        }
        capture_log(const capture_log &) = delete;
        capture_log & operator=(const capture_log &) = delete;

        auto text() const -> std::string
            { return m_stream.str(); }
    private:
        std::ostringstream m_stream;
        std::shared_ptr<spdlog::logger> m_saved;
    };
}

TEST_SUITE("logging") {

TEST_CASE("default logger") {
    auto saved = get_logger();
    REQUIRE(saved);

    set_logger(nullptr);
    auto deflt = get_logger();
    REQUIRE(deflt);
    CHECK(deflt->name() == logger_name);
    CHECK(spdlog::get(logger_name) == deflt);
    CHECK(get_logger() == deflt);

    set_logger(saved);
    CHECK(get_logger() == saved);
}

#ifndef _WIN32
TEST_CASE("level from environment") {
    auto saved = get_logger();
    auto global = spdlog::get_level();

    auto neighbour = std::make_shared<spdlog::logger>("mulid-neighbour", std::make_shared<spdlog::sinks::null_sink_mt>());
    neighbour->set_level(spdlog::level::info);
    spdlog::register_logger(neighbour);

    auto fresh_default = []() {
        spdlog::drop(logger_name);
        set_logger(nullptr);
        return get_logger();
    };

    REQUIRE(setenv("SPDLOG_LEVEL", "off, mulid-neighbour=trace , mulid = Debug", 1) == 0);
    auto deflt = fresh_default();
    CHECK(deflt->level() == spdlog::level::debug);
    CHECK(neighbour->level() == spdlog::level::info);
    CHECK(spdlog::get_level() == global);

    REQUIRE(setenv("SPDLOG_LEVEL", "mulid=off", 1) == 0);
    CHECK(fresh_default()->level() == spdlog::level::off);

    REQUIRE(setenv("SPDLOG_LEVEL", "mulid=bogus,trace", 1) == 0);
    CHECK(fresh_default()->level() == spdlog::level::warn);
    CHECK(spdlog::get_level() == global);

    REQUIRE(unsetenv("SPDLOG_LEVEL") == 0);
    CHECK(fresh_default()->level() == spdlog::level::warn);

    spdlog::drop(logger_name);
    spdlog::drop("mulid-neighbour");
    set_logger(saved);
}
#endif

TEST_CASE("trace") {
    capture_log log;

    test_clock clock{1508808576371};
    test_entropy entropy;
    entropy.queue.push_back({0x53,0x34,0xad,0xa7,0x8e,0xdc,0x1d,0x4a,0x6f,0x1e});
    generator gen(std::make_unique<test_time_source>(clock), std::make_unique<test_random_source>(entropy));
    (void)gen.generate();

    auto text = log.text();
    CHECK(text.find("trace generated 01BX5ZZKBKACTAV9WEVGEMMVRY: time 000000010101111101001011111111111100110101110011 random ") == 0);
    CHECK(text.find("0101001100110100" "1010110110100111100011101101110000011101010010100110111100011110") != std::string::npos);
}

TEST_CASE("quiet above trace") {
    capture_log log(spdlog::level::info);

    monotonic_generator gen(1469918176385);
    (void)gen.generate();
    (void)gen.generate();

    CHECK(log.text().empty());
}

TEST_CASE("clock going backwards") {
    capture_log log(spdlog::level::debug);

    test_clock clock{1000};
    test_entropy entropy;
    auto gen = monotonic_generator(std::make_unique<test_time_source>(clock), std::make_unique<test_random_source>(entropy));
    (void)gen.generate();
    clock.now = 990;
    (void)gen.generate();

    CHECK(log.text() == "debug clock moved backwards from 1000 to 990, drawing new randomness\n");
}

TEST_CASE("overflow") {
    capture_log log(spdlog::level::warn);

    test_clock clock{42};
    test_entropy entropy;
    entropy.fill_byte = 0xFF;
    auto gen = monotonic_generator(std::make_unique<test_time_source>(clock), std::make_unique<test_random_source>(entropy));
    (void)gen.generate();
    CHECK_THROWS_AS((void)gen.generate(), ulid_error);

    CHECK(log.text() == "warning monotonic overflow: randomness exhausted within millisecond 42\n");
}

}
