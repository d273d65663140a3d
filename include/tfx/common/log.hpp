/**
 * @file log.hpp
 * @brief tiny tagged logging helpers so subsystems leave greppable breadcrumbs uwu
 *
 * ⚠️ IMPURE FUNCTIONS (stdout/stderr side effects)
 *
 * every line is prefixed with a bracketed subsystem tag (e.g. "[tfx::sim]") so
 * run logs can be filtered without a logging framework. warnings and errors go
 * to stderr, progress chatter to stdout.
 *
 * @author TrussFlex contributors
 * @date 2026-10-05
 * @version 0.1
 *
 * @note std::println lands in GCC 14+; we build with GCC 15.2+ in -std=c++2c mode
 */
#pragma once

#include <cstdio>
#include <format>
#include <print>
#include <string_view>
#include <utility>

namespace tfx::log
{

/**
 * @brief print an informational line tagged with @p tag
 *
 * @tparam Args formatting argument pack forwarded to std::format
 */
template <typename... Args>
void info(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
{
    std::println("{} {}", tag, std::format(fmt, std::forward<Args>(args)...));
}

/**
 * @brief print a warning/error line tagged with @p tag to stderr
 */
template <typename... Args>
void error(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
{
    std::println(stderr, "{} {}", tag, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace tfx::log
