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

#ifndef MONIKER_FORMATTED_EXCEPTION_BASE_H
#define MONIKER_FORMATTED_EXCEPTION_BASE_H

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <type_traits>

namespace moniker
{

/**
 * Exception base whose constructor takes an fmt format string and its arguments.
 *
 * Concrete exceptions inherit its constructors:
 * @code
 *  struct EmptyCatalogException : FormattedExceptionBase<std::logic_error>
 *  {
 *      using FormattedExceptionBase<std::logic_error>::FormattedExceptionBase;
 *  };
 * @endcode
 *
 * @tparam BaseExceptionType Standard exception to derive from, constructible from a std::string.
 */
template <typename BaseExceptionType = std::runtime_error>
struct FormattedExceptionBase : public BaseExceptionType
{
    static_assert(std::is_constructible<BaseExceptionType, std::string>::value,
                  "BaseExceptionType must be constructible with (std::string)");
    static_assert(std::is_base_of<std::exception, BaseExceptionType>::value,
                  "BaseExceptionType must derive from std::exception");

    template <typename... Args>
    FormattedExceptionBase(fmt::format_string<Args...> fmt, Args&&... args)
        : BaseExceptionType(failsafe_format(fmt, std::forward<Args>(args)...))
    {
    }

private:
    /**
     * Format without letting fmt errors escape.
     *
     * Throwing from here would escape an exception constructor and end in std::terminate(), so a
     * formatting failure is reported in the message itself instead.
     */
    template <typename... Args>
    static std::string failsafe_format(fmt::format_string<Args...> fmt, Args&&... args)
    try
    {
        return fmt::format(fmt, std::forward<Args>(args)...);
    }
    catch (const std::exception& e)
    {
        std::string msg{"[Error while formatting the exception string]"};
        msg += "\nFormat string: `";
        const fmt::string_view fmt_view = fmt;
        msg.append(fmt_view.data(), fmt_view.size());
        msg += "`\nFormat error: `";
        msg += e.what();
        msg += '`';
        return msg;
    }
};

} // namespace moniker

#endif // MONIKER_FORMATTED_EXCEPTION_BASE_H
