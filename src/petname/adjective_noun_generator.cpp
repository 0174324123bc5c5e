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

#include "adjective_noun_generator.h"
#include "bounded_index.h"

#include <moniker/constants.h>
#include <moniker/logging/log.h>

#include <stdexcept>

namespace mk = moniker;
namespace mkl = moniker::logging;

namespace
{
// The engine takes the seed bit for bit, so negative seeds are as good as any other
std::mt19937_64 make_engine(std::int64_t seed)
{
    return std::mt19937_64(static_cast<std::mt19937_64::result_type>(seed));
}
} // namespace

mk::AdjectiveNounGenerator::AdjectiveNounGenerator(std::int64_t seed)
    : AdjectiveNounGenerator(seed, reference_word_catalog())
{
}

mk::AdjectiveNounGenerator::AdjectiveNounGenerator(std::int64_t seed, WordCatalog::SPtr catalog)
    : catalog{std::move(catalog)}, engine{make_engine(seed)}
{
    if (!this->catalog)
        throw std::invalid_argument("Name generator needs a word catalog");

    mkl::trace(petname_log_category, "Seeded name generator with {}", seed);
}

std::string mk::AdjectiveNounGenerator::make_name()
{
    const auto adjective = catalog->adjective_at(bounded_index(engine, catalog->adjective_count()));
    const auto noun = catalog->noun_at(bounded_index(engine, catalog->noun_count()));

    std::string name;
    name.reserve(adjective.size() + 1 + noun.size());
    name.append(adjective);
    name.push_back(name_separator);
    name.append(noun);

    return name;
}
