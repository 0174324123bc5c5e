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

#ifndef MONIKER_NAME_GENERATOR_H
#define MONIKER_NAME_GENERATOR_H

#include "disabled_copy_move.h"

#include <cstdint>
#include <memory>
#include <string>

namespace moniker
{
/**
 * Something that produces placeholder names, one per call.
 *
 * Implementations own mutable state and are not thread-safe. Give each worker its own
 * instance, or wrap a shared one in a LockedNameGenerator.
 */
class NameGenerator : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<NameGenerator>;
    virtual ~NameGenerator() = default;
    virtual std::string make_name() = 0;

protected:
    NameGenerator() = default;
};

/// Generator of "adjective-noun" names whose sequence is fully determined by seed
NameGenerator::UPtr make_seeded_name_generator(std::int64_t seed);

/// Generator seeded from MONIKER_SEED when set, from a random seed otherwise.
/// Throws InvalidSeedException if MONIKER_SEED holds something other than a 64-bit integer.
NameGenerator::UPtr make_default_name_generator();
} // namespace moniker
#endif // MONIKER_NAME_GENERATOR_H
