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

#ifndef MONIKER_LOCKED_NAME_GENERATOR_H
#define MONIKER_LOCKED_NAME_GENERATOR_H

#include <moniker/name_generator.h>

#include <mutex>

namespace moniker
{
/**
 * Lets several threads share one generator, and therefore one seeded sequence.
 *
 * Each make_name() call on the wrapped generator runs under a lock. Names come out in the
 * wrapped generator's order; which thread receives which name depends on scheduling.
 * Prefer one generator per thread when a shared sequence is not needed.
 */
class LockedNameGenerator final : public NameGenerator
{
public:
    /// Takes ownership of generator, which must not be null
    explicit LockedNameGenerator(NameGenerator::UPtr generator);

    std::string make_name() override;

private:
    NameGenerator::UPtr generator;
    std::mutex mutex;
};
} // namespace moniker

#endif // MONIKER_LOCKED_NAME_GENERATOR_H
