/**
 * @file log.hpp
 * @brief tiny tagged logging helpers (std::println with a grep-friendly prefix)
 */
#pragma once

#include <cstdio>
#include <format>
#include <print>
#include <string_view>
#include <utility>

namespace ufg::common
{

/**
 * @brief print an informational breadcrumb to stdout as "[ufg::<tag>] message"
 *
 * ⚠️ IMPURE FUNCTION (has side effects)
 *
 * @tparam Args formatting argument pack forwarded to std::format
 *
 * @param[in] tag subsystem name ("sync", "vma", ...)
 * @param[in] fmt `std::format`-style string literal
 * @param[in] args arguments that satisfy the format string requirements
 */
template <typename... Args>
void log_line(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
{
    std::println("[ufg::{}] {}", tag, std::format(fmt, std::forward<Args>(args)...));
}

/**
 * @brief same as log_line but routed to stderr
 */
template <typename... Args>
void log_error(std::string_view tag, std::format_string<Args...> fmt, Args &&...args)
{
    std::println(stderr, "[ufg::{}] {}", tag, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace ufg::common
