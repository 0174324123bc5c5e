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

#ifndef MONIKER_LEVEL_H
#define MONIKER_LEVEL_H

#include <moniker/logging/cstring.h>

#include <type_traits>

namespace moniker
{
namespace logging
{

/**
 * Severity of a log entry, most severe first.
 */
enum class Level : int
{
    error = 0,   /**< Something the caller asked for could not be done, e.g. an unusable seed in the environment */
    warning = 1, /**< Something looks off but work carries on */
    info = 2,    /**< Useful to whoever embeds the library */
    debug = 3,   /**< Troubleshooting aid, e.g. which seed a default generator picked */
    trace = 4    /**< Per-instance chatter that would clutter logs if enabled by default */
};

constexpr CString as_string(const Level& l) noexcept
{
    switch (l)
    {
    case Level::error:
        return "error";
    case Level::warning:
        return "warning";
    case Level::info:
        return "info";
    case Level::debug:
        return "debug";
    case Level::trace:
        return "trace";
    }
    return "unknown";
}

constexpr auto enum_type(Level e) noexcept
{
    return static_cast<std::underlying_type_t<Level>>(e);
}

constexpr bool operator<(Level a, Level b) noexcept
{
    return enum_type(a) < enum_type(b);
}

constexpr bool operator<=(Level a, Level b) noexcept
{
    return enum_type(a) <= enum_type(b);
}
} // namespace logging
} // namespace moniker

#endif // MONIKER_LEVEL_H
