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

#include <moniker/logging/log.h>

#include <fmt/format.h>

#include <cstdio>
#include <mutex>
#include <shared_mutex>

namespace mkl = moniker::logging;

namespace
{
std::shared_timed_mutex mutex;
std::shared_ptr<mkl::Logger> global_logger;

constexpr auto fallback_level = mkl::Level::error;
} // namespace

void mkl::log(Level level, CString category, CString message)
{
    std::shared_lock<decltype(mutex)> lock{mutex};
    if (global_logger)
        global_logger->log(level, category, message);
    else if (level <= fallback_level)
        fmt::print(stderr, "[{}] [{}] {}\n", as_string(level).c_str(), category.c_str(), message.c_str());
}

mkl::Level mkl::get_logging_level()
{
    std::shared_lock<decltype(mutex)> lock{mutex};
    if (global_logger)
        return global_logger->get_logging_level();

    return fallback_level;
}

void mkl::set_logger(std::shared_ptr<Logger> logger)
{
    std::lock_guard<decltype(mutex)> lock{mutex};
    global_logger = std::move(logger);
}

auto mkl::get_logger() -> Logger*
{
    std::shared_lock<decltype(mutex)> lock{mutex};
    return global_logger.get();
}
