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

#ifndef MONIKER_ADJECTIVE_NOUN_GENERATOR_H
#define MONIKER_ADJECTIVE_NOUN_GENERATOR_H

#include <moniker/name_generator.h>
#include <moniker/word_catalog.h>

#include <cstdint>
#include <random>
#include <string>

namespace moniker
{
class AdjectiveNounGenerator final : public NameGenerator
{
public:
    /// Constructs an instance that draws from the reference catalog,
    /// using seed as the only source of entropy
    explicit AdjectiveNounGenerator(std::int64_t seed);
    /// Constructs an instance that draws from the given catalog,
    /// using seed as the only source of entropy
    AdjectiveNounGenerator(std::int64_t seed, WordCatalog::SPtr catalog);

    /// Returns "adjective-noun", drawing the adjective first, then the noun
    std::string make_name() override;

private:
    WordCatalog::SPtr catalog;
    std::mt19937_64 engine;
};
} // namespace moniker
#endif // MONIKER_ADJECTIVE_NOUN_GENERATOR_H
