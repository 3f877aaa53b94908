/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <utility>

#include <fmt/format.h>

#include <seastar/util/log.hh>

namespace logging {

using log_level = seastar::log_level;
using logger = seastar::logger;

}

// Logs `format` at `log_level` and throws `ExceptionType` carrying the same message.
template <typename ExceptionType, typename... Args>
[[noreturn]] void log_and_throw(seastar::logger& logger, seastar::log_level log_level, fmt::format_string<Args...> format, Args&&... args) {
    auto msg = fmt::format(format, std::forward<Args>(args)...);
    logger.log(log_level, "{}", msg);
    throw ExceptionType(msg);
}
