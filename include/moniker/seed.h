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

#ifndef MONIKER_SEED_H
#define MONIKER_SEED_H

#include <cstdint>
#include <optional>

namespace moniker
{
// Full 64 bits from std::random_device
std::int64_t random_seed();

// The seed in MONIKER_SEED, or nullopt when the variable is unset or empty.
// Throws InvalidSeedException when it does not hold a decimal 64-bit signed integer.
std::optional<std::int64_t> seed_from_environment();
} // namespace moniker

#endif // MONIKER_SEED_H
