// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <modern-ulid/logging.h>

#include <spdlog/sinks/null_sink.h>

int main(int argc, char ** argv)
{
    #if defined (_WIN32)
        SetConsoleOutputCP(CP_UTF8);
    #endif

    //keep expected warnings out of test output
    mulid::set_logger(std::make_shared<spdlog::logger>("mulid-test", std::make_shared<spdlog::sinks::null_sink_mt>()));

    return doctest::Context(argc, argv).run();
}
