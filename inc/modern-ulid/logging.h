// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_LOGGING_H_INCLUDED
#define HEADER_MODERN_ULID_LOGGING_H_INCLUDED

#include <modern-ulid/common.h>

#include <spdlog/logger.h>

#include <memory>

namespace mulid {

    /// Name of the default library logger in spdlog registry
    inline constexpr const char * logger_name = "mulid";

    /**
     * Set the logger used by this library
     *
     * Pass `nullptr` to go back to the default one. The default logger writes to stderr
     * at `warn` level. Its level can be changed via the `mulid` entry of `SPDLOG_LEVEL`
     * environment variable (e.g. `SPDLOG_LEVEL=mulid=trace`). Other entries are ignored.
     */
    MULID_EXPORTED void set_logger(std::shared_ptr<spdlog::logger> logger);

    /// Returns the logger used by this library. Never null.
    MULID_EXPORTED auto get_logger() -> std::shared_ptr<spdlog::logger>;
}

#endif
