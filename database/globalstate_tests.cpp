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

#include "globalstate.hpp"

#include "dbtest.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace lpd
{
namespace
{

class GlobalStateTests : public DBTestWithSchema
{

protected:

  GlobalStateTable tbl;

  GlobalStateTests ()
    : tbl(db)
  {}

};

TEST_F (GlobalStateTests, Initialise)
{
  EXPECT_FALSE (tbl.IsInitialised ());
  EXPECT_EQ (tbl.Get (), nullptr);

  tbl.Initialise (43, 3);
  EXPECT_TRUE (tbl.IsInitialised ());

  auto g = tbl.Get ();
  EXPECT_EQ (g->GetTotalStaked (), 0);
  EXPECT_EQ (g->GetRewardPool (), 0);
  EXPECT_EQ (g->GetApy (), 43);
  EXPECT_EQ (g->GetFeePercent (), 3);

  EXPECT_DEATH (tbl.Initialise (1, 1), "already been initialised");
}

TEST_F (GlobalStateTests, Update)
{
  tbl.Initialise (43, 3);

  auto g = tbl.Get ();
  g->SetTotalStaked (500);
  g->SetRewardPool (1'000);
  g->SetParameters (10, 5);
  g.reset ();

  g = tbl.Get ();
  EXPECT_EQ (g->GetTotalStaked (), 500);
  EXPECT_EQ (g->GetRewardPool (), 1'000);
  EXPECT_EQ (g->GetApy (), 10);
  EXPECT_EQ (g->GetFeePercent (), 5);
}

TEST_F (GlobalStateTests, FullUnsignedRange)
{
  const Amount big = std::numeric_limits<Amount>::max ();
  tbl.Initialise (0, 0)->SetRewardPool (big);
  EXPECT_EQ (tbl.Get ()->GetRewardPool (), big);
}

} // anonymous namespace
} // namespace lpd
