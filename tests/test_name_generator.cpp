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

#include "common.h"
#include "mock_environment_helpers.h"
#include "mock_logger.h"
#include "mock_name_generator.h"

#include <moniker/constants.h>
#include <moniker/exceptions/seed_exceptions.h>
#include <moniker/name_generator.h>

#include <string>
#include <vector>

namespace mk = moniker;
namespace mkl = moniker::logging;
namespace mkt = moniker::test;

using namespace testing;

namespace
{
// Stands in for caller code that only knows the abstraction
std::vector<std::string> container_names(mk::NameGenerator& generator, int count)
{
    std::vector<std::string> names;
    for (auto i = 0; i < count; ++i)
        names.push_back("moniker-" + generator.make_name());

    return names;
}
} // namespace

struct NameGeneratorFactoryTests : public Test
{
    mkt::MockLogger::Scope logger_scope = mkt::MockLogger::inject(mkl::Level::debug);
};

TEST_F(NameGeneratorFactoryTests, seededGeneratorFollowsSeed)
{
    auto generator = mk::make_seeded_name_generator(42);

    EXPECT_THAT(mkt::take_names(*generator, 3), ElementsAre("dark-leaf", "misty-shape", "cool-sound"));
}

TEST_F(NameGeneratorFactoryTests, defaultGeneratorUsesSeedFromEnvironment)
{
    mkt::SetEnvScope env{mk::seed_env_var, "12345"};
    logger_scope.mock_logger->expect_log(mkl::Level::debug, "Using seed 12345 from MONIKER_SEED");

    auto generator = mk::make_default_name_generator();

    EXPECT_THAT(mkt::take_names(*generator, 2), ElementsAre("wandering-river", "dawn-moon"));
}

TEST_F(NameGeneratorFactoryTests, defaultGeneratorFallsBackToRandomSeed)
{
    mkt::UnsetEnvScope env{mk::seed_env_var};
    logger_scope.mock_logger->expect_log(mkl::Level::debug, "Using random seed");

    auto generator = mk::make_default_name_generator();

    EXPECT_THAT(generator->make_name(), mkt::is_adjective_noun_name());
}

TEST_F(NameGeneratorFactoryTests, defaultGeneratorTreatsEmptySeedAsUnset)
{
    mkt::SetEnvScope env{mk::seed_env_var, ""};
    logger_scope.mock_logger->expect_log(mkl::Level::debug, "Using random seed");

    auto generator = mk::make_default_name_generator();

    EXPECT_THAT(generator->make_name(), mkt::is_adjective_noun_name());
}

TEST_F(NameGeneratorFactoryTests, defaultGeneratorRejectsBadSeed)
{
    mkt::SetEnvScope env{mk::seed_env_var, "not-a-number"};

    MK_EXPECT_THROW_THAT(mk::make_default_name_generator(),
                         mk::InvalidSeedException,
                         mkt::match_what(HasSubstr("not-a-number")));
}

TEST_F(NameGeneratorFactoryTests, callersWorkWithAnyGenerator)
{
    mkt::MockNameGenerator mock;
    EXPECT_CALL(mock, make_name).Times(2).WillRepeatedly(Return("still-lake"));

    EXPECT_THAT(container_names(mock, 2), Each(Eq("moniker-still-lake")));
}

TEST_F(NameGeneratorFactoryTests, callersGetSeededSequenceThroughAbstraction)
{
    auto generator = mk::make_seeded_name_generator(0);

    EXPECT_THAT(container_names(*generator, 2), ElementsAre("moniker-crimson-forest", "moniker-floral-brook"));
}
