// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/logging.h>
#include <modern-ulid/threading.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/details/os.h>

#include <algorithm>
#include <string_view>

using namespace mulid;

static impl::mutex_if_multithreaded g_logger_mutex;
static std::shared_ptr<spdlog::logger> g_logger;

static auto trim(std::string_view str) -> std::string_view {
    auto first = str.find_first_not_of(" \t");
    if (first == std::string_view::npos)
        return {};
    auto last = str.find_last_not_of(" \t");
    return str.substr(first, last - first + 1);
}

//Applies only the `<name>=<level>` entries of SPDLOG_LEVEL that name this logger.
//Other loggers and the global level belong to the application.
static void apply_env_level(spdlog::logger & logger) {
    auto env = spdlog::details::os::getenv("SPDLOG_LEVEL");
    std::string_view rest = env;
    while (!rest.empty()) {
        auto comma = rest.find(',');
        auto entry = rest.substr(0, comma);
        rest = (comma == std::string_view::npos ? std::string_view() : rest.substr(comma + 1));

        auto eq = entry.find('=');
        if (eq == std::string_view::npos || trim(entry.substr(0, eq)) != logger.name())
            continue;

        std::string value(trim(entry.substr(eq + 1)));
        std::transform(value.begin(), value.end(), value.begin(), [](char c) {
            return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c;
        });
        auto level = spdlog::level::from_str(value);
        if (level == spdlog::level::off && value != "off")
            continue;
        logger.set_level(level);
    }
}

static auto make_default_logger() -> std::shared_ptr<spdlog::logger> {
    if (auto existing = spdlog::get(logger_name))
        return existing;

    auto ret = std::make_shared<spdlog::logger>(logger_name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    ret->set_level(spdlog::level::warn);
    apply_env_level(*ret);
    spdlog::register_logger(ret);
    return ret;
}

void mulid::set_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard guard{g_logger_mutex};
    g_logger = std::move(logger);
}

auto mulid::get_logger() -> std::shared_ptr<spdlog::logger> {
    std::lock_guard guard{g_logger_mutex};
    if (!g_logger)
        g_logger = make_default_logger();
    return g_logger;
}
