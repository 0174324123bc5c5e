/*
 * Copyright (C) Canonical, Ltd.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 3.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef MONIKER_LOG_H
#define MONIKER_LOG_H

#include <moniker/logging/cstring.h>
#include <moniker/logging/level.h>
#include <moniker/logging/logger.h>

#include <fmt/format.h>

#include <memory>
#include <string>

namespace moniker
{
namespace logging
{

/**
 * Send a message to the installed logger.
 *
 * When no logger has been installed, errors are printed to stderr and everything else is dropped,
 * so that embedding the library stays quiet by default.
 */
void log(Level level, CString category, CString message);
void set_logger(std::shared_ptr<Logger> logger);
Level get_logging_level();
Logger* get_logger(); // for tests, don't rely on it lasting

/**
 * Log with formatting support.
 *
 * The plain overload above and this one are told apart by the presence of at least one format
 * argument, which is why the first argument is spelled out explicitly.
 *
 * @tparam Arg0 Type of the first format argument
 * @tparam Args Type of the rest of the format arguments
 * @param level Log level
 * @param category Log category
 * @param fmt Format string
 * @param arg0 The first format argument
 * @param args Rest of the format arguments
 */
template <typename Arg0, typename... Args>
constexpr void
log(Level level, const std::string& category, fmt::format_string<Arg0, Args...> fmt, Arg0&& arg0, Args&&... args)
{
    const auto formatted_log_msg = fmt::format(fmt, std::forward<Arg0>(arg0), std::forward<Args>(args)...);
    logging::log(level, category, formatted_log_msg);
}

/**
 * Dispatch between the formatting and plain overloads based on argument count.
 *
 * @tparam level Log level
 * @tparam Args Format argument types
 * @param category Log category
 * @param fmt Format string
 * @param args Format arguments, if any
 */
template <Level level, typename... Args>
constexpr void log(const std::string& category, fmt::format_string<Args...> fmt, Args&&... args)
{
    if constexpr (sizeof...(Args) > 0)
    {
        logging::log(level, category, fmt, std::forward<Args>(args)...);
    }
    else
    {
        const std::string message{fmt.get().data(), fmt.get().size()};
        logging::log(level, category, message);
    }
}

template <typename... Args>
constexpr void error(const std::string& category, fmt::format_string<Args...> fmt, Args&&... args)
{
    logging::log<Level::error>(category, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
constexpr void warn(const std::string& category, fmt::format_string<Args...> fmt, Args&&... args)
{
    logging::log<Level::warning>(category, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
constexpr void info(const std::string& category, fmt::format_string<Args...> fmt, Args&&... args)
{
    logging::log<Level::info>(category, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
constexpr void debug(const std::string& category, fmt::format_string<Args...> fmt, Args&&... args)
{
    logging::log<Level::debug>(category, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
constexpr void trace(const std::string& category, fmt::format_string<Args...> fmt, Args&&... args)
{
    logging::log<Level::trace>(category, fmt, std::forward<Args>(args)...);
}

} // namespace logging
} // namespace moniker
#endif // MONIKER_LOG_H
