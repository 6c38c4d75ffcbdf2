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

#include "staking.hpp"

#include "testutils.hpp"

#include "database/balances.hpp"
#include "database/dbtest.hpp"
#include "database/globalstate.hpp"
#include "database/presale.hpp"
#include "database/stakes.hpp"

#include <gtest/gtest.h>

#include <glog/logging.h>

#include <limits>

namespace lpd
{
namespace
{

/* ************************************************************************** */

TEST (WeightedStartTimeTests, Basic)
{
  Timestamp res;

  ASSERT_TRUE (WeightedStartTime (100, 1'000, 100, 2'000, res));
  EXPECT_EQ (res, 1'500);

  ASSERT_TRUE (WeightedStartTime (300, 1'000, 100, 2'000, res));
  EXPECT_EQ (res, 1'250);

  ASSERT_TRUE (WeightedStartTime (2, 0, 1, 10, res));
  EXPECT_EQ (res, 3);
}

TEST (WeightedStartTimeTests, Overflow)
{
  const Amount big = std::numeric_limits<Amount>::max ();
  Timestamp res;

  EXPECT_FALSE (WeightedStartTime (big, 0, 1, 10, res));
  EXPECT_FALSE (WeightedStartTime (1, 0, big / 2, 10, res));
  EXPECT_FALSE (WeightedStartTime (1, 10, 1, 5, res));
}

/* ************************************************************************** */

class StakingEngineTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;
  DatabaseLedger ledger;
  StakingEngine staking;

  BalancesTable balances;
  StakesTable stakes;

  std::string token;
  std::string pool;

  StakingEngineTests ()
    : ledger(db, ctx.RoConfig ()->currencies ().token ()),
      staking(db, ledger, ctx),
      balances(db), stakes(db),
      token(ctx.RoConfig ()->currencies ().token ()),
      pool(ctx.RoConfig ()->holdings ().staking_pool ())
  {
    PresaleTable presale(db);
    presale.Initialise ("admin");
    CHECK (staking.InitialiseGlobalState (43, 3).IsOk ());
    SetRewardPool (1'000'000);

    balances.Set (AccountHolding ("domob"), token, 10'000'000);
  }

  void
  SetRewardPool (const Amount val)
  {
    GlobalStateTable tbl(db);
    tbl.Get ()->SetRewardPool (val);
  }

  GlobalStateTable::Handle
  GetGlobal ()
  {
    GlobalStateTable tbl(db);
    return tbl.Get ();
  }

};

TEST_F (StakingEngineTests, InitialiseTwice)
{
  EXPECT_EQ (staking.InitialiseGlobalState (1, 2).GetCode (),
             ErrorCode::ALREADY_INITIALISED);
  EXPECT_EQ (GetGlobal ()->GetApy (), 43);
}

TEST_F (StakingEngineTests, FirstStake)
{
  ctx.SetTimestamp (5'000);
  ASSERT_TRUE (staking.Stake ("domob", 1'000).IsOk ());

  auto s = stakes.GetByName ("domob");
  ASSERT_NE (s, nullptr);
  EXPECT_EQ (s->GetAmount (), 1'000);
  EXPECT_EQ (s->GetStartTime (), 5'000);
  EXPECT_EQ (s->GetLastClaimTime (), 5'000);

  EXPECT_EQ (GetGlobal ()->GetTotalStaked (), 1'000);
  EXPECT_EQ (balances.Get (AccountHolding ("domob"), token), 9'999'000);
  EXPECT_EQ (balances.Get (pool, token), 1'000);
}

TEST_F (StakingEngineTests, RestakeResetsClock)
{
  ctx.SetStakeClock (proto::RESET);

  ctx.SetTimestamp (1'000);
  ASSERT_TRUE (staking.Stake ("domob", 100).IsOk ());
  ctx.SetTimestamp (2'000);
  ASSERT_TRUE (staking.Stake ("domob", 300).IsOk ());

  auto s = stakes.GetByName ("domob");
  EXPECT_EQ (s->GetAmount (), 400);
  EXPECT_EQ (s->GetStartTime (), 2'000);
  EXPECT_EQ (s->GetLastClaimTime (), 2'000);
  EXPECT_EQ (GetGlobal ()->GetTotalStaked (), 400);
}

TEST_F (StakingEngineTests, RestakeWeightedAverage)
{
  ctx.SetStakeClock (proto::WEIGHTED_AVERAGE);

  ctx.SetTimestamp (1'000);
  ASSERT_TRUE (staking.Stake ("domob", 300).IsOk ());
  ctx.SetTimestamp (2'000);
  ASSERT_TRUE (staking.Stake ("domob", 100).IsOk ());

  auto s = stakes.GetByName ("domob");
  EXPECT_EQ (s->GetAmount (), 400);
  EXPECT_EQ (s->GetStartTime (), 1'250);
  EXPECT_EQ (s->GetLastClaimTime (), 2'000);
}

TEST_F (StakingEngineTests, MultipleStakers)
{
  balances.Set (AccountHolding ("andy"), token, 500);

  ASSERT_TRUE (staking.Stake ("domob", 1'000).IsOk ());
  ASSERT_TRUE (staking.Stake ("andy", 500).IsOk ());

  EXPECT_EQ (GetGlobal ()->GetTotalStaked (), 1'500);

  Amount sum;
  ASSERT_TRUE (stakes.SumAmounts (sum));
  EXPECT_EQ (sum, 1'500);
}

TEST_F (StakingEngineTests, PresaleNotActive)
{
  PresaleTable presale(db);
  presale.Get ()->End (ctx.Timestamp (), 100);

  EXPECT_EQ (staking.Stake ("domob", 1'000).GetCode (),
             ErrorCode::STAKING_CLOSED);
  EXPECT_EQ (stakes.GetByName ("domob"), nullptr);
}

TEST_F (StakingEngineTests, RewardsExhausted)
{
  SetRewardPool (0);
  EXPECT_EQ (staking.Stake ("domob", 1'000).GetCode (),
             ErrorCode::STAKING_REWARDS_EXHAUSTED);
}

TEST_F (StakingEngineTests, ZeroAmount)
{
  EXPECT_EQ (staking.Stake ("domob", 0).GetCode (), ErrorCode::INVALID_AMOUNT);
  EXPECT_EQ (stakes.GetByName ("domob"), nullptr);
}

TEST_F (StakingEngineTests, InsufficientBalance)
{
  EXPECT_EQ (staking.Stake ("domob", 10'000'001).GetCode (),
             ErrorCode::INSUFFICIENT_FUNDS);

  EXPECT_EQ (stakes.GetByName ("domob"), nullptr);
  EXPECT_EQ (GetGlobal ()->GetTotalStaked (), 0);
  EXPECT_EQ (balances.Get (AccountHolding ("domob"), token), 10'000'000);
}

TEST_F (StakingEngineTests, TotalOverflow)
{
  GetGlobal ()->SetTotalStaked (std::numeric_limits<Amount>::max ());

  EXPECT_EQ (staking.Stake ("domob", 1).GetCode (),
             ErrorCode::ARITHMETIC_FAULT);
  EXPECT_EQ (balances.Get (AccountHolding ("domob"), token), 10'000'000);
}

/* ************************************************************************** */

} // anonymous namespace
} // namespace lpd
