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

#include <moniker/locked_name_generator.h>

#include <stdexcept>

namespace mk = moniker;

mk::LockedNameGenerator::LockedNameGenerator(NameGenerator::UPtr generator) : generator{std::move(generator)}
{
    if (!this->generator)
        throw std::invalid_argument("Cannot lock a null name generator");
}

std::string mk::LockedNameGenerator::make_name()
{
    std::lock_guard<decltype(mutex)> lock{mutex};
    return generator->make_name();
}
