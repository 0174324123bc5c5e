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

#ifndef MONIKER_BOUNDED_INDEX_H
#define MONIKER_BOUNDED_INDEX_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace moniker
{
/**
 * Draw an index uniformly from [0, bound) using the raw output of a 64-bit engine.
 *
 * Draws that fall in the incomplete last block of size bound are rejected, so the result carries no
 * modulo bias. Unlike std::uniform_int_distribution, the result for a given engine state is the
 * same with every standard library.
 *
 * @tparam Engine A random engine producing the full std::uint64_t range, e.g. std::mt19937_64
 * @param engine Engine to draw from, advanced at least once
 * @param bound Exclusive upper bound, must be positive
 * @return An index in [0, bound)
 */
template <typename Engine>
std::size_t bounded_index(Engine& engine, std::size_t bound)
{
    static_assert(Engine::min() == 0 && Engine::max() == std::numeric_limits<std::uint64_t>::max(),
                  "bounded_index needs an engine covering all 64 bits");

    if (bound == 0)
        throw std::invalid_argument("Cannot draw an index from an empty range");

    const std::uint64_t span = bound;
    const std::uint64_t limit = (std::numeric_limits<std::uint64_t>::max() / span) * span;

    std::uint64_t r;
    do
    {
        r = engine();
    } while (r >= limit);

    return static_cast<std::size_t>(r % span);
}
} // namespace moniker

#endif // MONIKER_BOUNDED_INDEX_H
