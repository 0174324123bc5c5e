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

#ifndef MONIKER_STANDARD_LOGGER_H
#define MONIKER_STANDARD_LOGGER_H

#include <moniker/logging/logger.h>

#include <iosfwd>

namespace moniker
{
namespace logging
{
class StandardLogger : public Logger
{
public:
    /**
     * Log to stderr.
     *
     * @param [in] level Log calls less severe than this are filtered out.
     */
    explicit StandardLogger(Level level);

    /**
     * Log to an arbitrary stream.
     *
     * @param [in] level Log calls less severe than this are filtered out.
     * @param [in] target ostream to write the output to, must outlive the logger
     */
    StandardLogger(Level level, std::ostream& target);

    void log(Level level, CString category, CString message) const override;

private:
    std::ostream& target;
};
} // namespace logging
} // namespace moniker
#endif // MONIKER_STANDARD_LOGGER_H
