/*
 * Copyright (C) 2014-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/util/log.hh>
#include <fmt/format.h>

namespace logging {

//
// Components log through seastar's logger. Keep short aliases so call sites
// read logging::logger / logging::log_level.
//

using log_level = seastar::log_level;
using logger = seastar::logger;
using settings = seastar::logging_settings;

inline void apply_settings(const settings& s) {
    seastar::apply_logging_settings(s);
}

}

template <typename ExceptionType, typename... Args>
[[noreturn]] void log_and_throw(seastar::logger& logger, seastar::log_level log_level, fmt::format_string<Args...> fmt, Args&&... args) {
    auto msg = fmt::format(fmt, std::forward<Args>(args)...);
    logger.log(log_level, "{}", msg);
    throw ExceptionType(msg);
}

template <typename ExceptionType, typename... Args>
[[noreturn]] void log_warning_and_throw(seastar::logger& logger, fmt::format_string<Args...> fmt, Args&&... args) {
    log_and_throw<ExceptionType>(logger, seastar::log_level::warn, fmt, std::forward<Args>(args)...);
}
