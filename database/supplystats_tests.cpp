/*
    GSP for the Launchpad token presale
    Copyright (C) 2021  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "supplystats.hpp"

#include "dbtest.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace lpd
{
namespace
{

class SupplyStatsTests : public DBTestWithSchema
{

protected:

  SupplyStats s;

  SupplyStatsTests ()
    : s(db)
  {
    // DBTestWithSchema already calls InitialiseDatabase.
  }

};

TEST_F (SupplyStatsTests, GetAndIncrement)
{
  EXPECT_EQ (s.Get ("burnt"), 0);
  EXPECT_EQ (s.Get ("fees"), 0);

  EXPECT_TRUE (s.Increment ("burnt", 42));
  EXPECT_TRUE (s.Increment ("burnt", 100));
  EXPECT_TRUE (s.Increment ("fees", 3));

  EXPECT_EQ (s.Get ("burnt"), 142);
  EXPECT_EQ (s.Get ("fees"), 3);
  EXPECT_EQ (s.Get ("minted"), 0);
}

TEST_F (SupplyStatsTests, FullRange)
{
  const Amount big = std::numeric_limits<Amount>::max () - 1;
  ASSERT_TRUE (s.Increment ("minted", big));
  EXPECT_EQ (s.Get ("minted"), big);

  EXPECT_FALSE (s.Increment ("minted", 2));
  EXPECT_EQ (s.Get ("minted"), big);

  EXPECT_TRUE (s.Increment ("minted", 1));
  EXPECT_EQ (s.Get ("minted"), std::numeric_limits<Amount>::max ());
}

TEST_F (SupplyStatsTests, AllKeys)
{
  for (const auto& k : s.GetValidKeys ())
    EXPECT_EQ (s.Get (k), 0);
}

TEST_F (SupplyStatsTests, DoubleInitialisation)
{
  EXPECT_DEATH (s.InitialiseDatabase (), "UNIQUE constraint failed");
}

TEST_F (SupplyStatsTests, InvalidCalls)
{
  EXPECT_DEATH (s.Get ("invalid"), "Invalid key: invalid");
  EXPECT_DEATH (s.Increment ("invalid", 1), "Invalid key: invalid");
  EXPECT_DEATH (s.Increment ("burnt", 0), "value > 0");
}

} // anonymous namespace
} // namespace lpd
