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

#include <moniker/logging/level.h>
#include <moniker/logging/log.h>
#include <moniker/logging/standard_logger.h>
#include <moniker/name_generator.h>

#include <memory>
#include <sstream>

namespace mk = moniker;
namespace mkl = moniker::logging;

using uut_t = mkl::StandardLogger;

TEST(StandardLoggerTests, callLog)
{
    std::ostringstream mock_stderr;
    uut_t logger{mkl::Level::debug, mock_stderr};
    logger.log(mkl::Level::debug, "cat", "msg");
    ASSERT_THAT(mock_stderr.str(), testing::HasSubstr("[debug] [cat] msg"));
}

TEST(StandardLoggerTests, callLogFiltered)
{
    std::ostringstream mock_stderr;
    uut_t logger{mkl::Level::debug, mock_stderr};
    logger.log(mkl::Level::trace, "cat", "msg");
    ASSERT_TRUE(mock_stderr.str().empty());
}

TEST(StandardLoggerTests, linesStartWithTimestamp)
{
    std::ostringstream mock_stderr;
    uut_t logger{mkl::Level::error, mock_stderr};
    logger.log(mkl::Level::error, "cat", "msg");
    EXPECT_THAT(mock_stderr.str(), testing::ContainsRegex("^\\[[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9:.]+"));
    EXPECT_THAT(mock_stderr.str(), testing::EndsWith("] [error] [cat] msg\n"));
}

TEST(StandardLoggerTests, receivesLibraryLogsWhenInstalled)
{
    std::ostringstream mock_stderr;
    mkl::set_logger(std::make_shared<uut_t>(mkl::Level::trace, mock_stderr));

    auto generator = mk::make_seeded_name_generator(8);
    mkl::set_logger(nullptr);

    EXPECT_THAT(mock_stderr.str(), testing::HasSubstr("[trace] [petname] Seeded name generator with 8"));
}
