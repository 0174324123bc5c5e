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

#include <moniker/constants.h>
#include <moniker/logging/log.h>
#include <moniker/name_generator.h>
#include <moniker/seed.h>

namespace mk = moniker;
namespace mkl = moniker::logging;

mk::NameGenerator::UPtr mk::make_seeded_name_generator(std::int64_t seed)
{
    return std::make_unique<AdjectiveNounGenerator>(seed);
}

mk::NameGenerator::UPtr mk::make_default_name_generator()
{
    if (const auto seed = seed_from_environment())
    {
        mkl::debug(petname_log_category, "Using seed {} from {}", *seed, seed_env_var);
        return make_seeded_name_generator(*seed);
    }

    const auto seed = random_seed();
    mkl::debug(petname_log_category, "Using random seed {}, set {} to reproduce", seed, seed_env_var);
    return make_seeded_name_generator(seed);
}
