/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace detail {

inline void log_line(std::string_view level, const std::string &msg) { std::cerr << "[" << level << "] " << msg << "\n"; }

} // namespace detail

template <typename... Args> void log_info(std::format_string<Args...> fmt, Args &&...args) {
    detail::log_line("info", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args> void log_warn(std::format_string<Args...> fmt, Args &&...args) {
    detail::log_line("warn", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args> void log_error(std::format_string<Args...> fmt, Args &&...args) {
    detail::log_line("error", std::format(fmt, std::forward<Args>(args)...));
}
