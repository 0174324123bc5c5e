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

#include <moniker/constants.h>
#include <moniker/exceptions/seed_exceptions.h>
#include <moniker/format.h>
#include <moniker/logging/log.h>
#include <moniker/seed.h>

#include <QString>
#include <QtGlobal>

#include <random>

namespace mk = moniker;
namespace mkl = moniker::logging;

std::int64_t mk::random_seed()
{
    std::random_device device;
    const auto high = static_cast<std::uint64_t>(device()) << 32;
    const auto low = static_cast<std::uint64_t>(device()) & 0xffffffffu;
    return static_cast<std::int64_t>(high | low);
}

std::optional<std::int64_t> mk::seed_from_environment()
{
    const auto value = qEnvironmentVariable(seed_env_var).trimmed();
    if (value.isEmpty())
        return std::nullopt;

    bool ok = false;
    const auto seed = value.toLongLong(&ok);
    if (!ok)
    {
        mkl::warn(petname_log_category, "Cannot use {}=\"{}\" as a seed", seed_env_var, value);
        throw InvalidSeedException("Invalid value for {}: \"{}\" is not a 64-bit signed integer",
                                   seed_env_var,
                                   value);
    }

    return static_cast<std::int64_t>(seed);
}
