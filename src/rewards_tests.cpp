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

#include "rewards.hpp"

#include "testutils.hpp"

#include "database/balances.hpp"
#include "database/dbtest.hpp"
#include "database/globalstate.hpp"
#include "database/stakes.hpp"
#include "database/supplystats.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace lpd
{
namespace
{

constexpr Timestamp TERM = 180 * SECONDS_PER_DAY;

TEST (ComputeRewardTests, Basic)
{
  Amount reward;

  ASSERT_TRUE (ComputeReward (1'000'000, 43, 90 * SECONDS_PER_DAY, TERM,
                              reward));
  EXPECT_EQ (reward, 215'000);

  ASSERT_TRUE (ComputeReward (1'000'000, 43, TERM, TERM, reward));
  EXPECT_EQ (reward, 430'000);

  ASSERT_TRUE (ComputeReward (0, 43, TERM, TERM, reward));
  EXPECT_EQ (reward, 0);
}

TEST (ComputeRewardTests, Truncates)
{
  Amount reward;
  ASSERT_TRUE (ComputeReward (100, 43, 1, TERM, reward));
  EXPECT_EQ (reward, 0);
}

TEST (ComputeRewardTests, Overflow)
{
  Amount reward;
  EXPECT_FALSE (ComputeReward (std::numeric_limits<Amount>::max (), 43,
                               1, TERM, reward));
  EXPECT_FALSE (ComputeReward (1'000'000'000'000, 1'000,
                               100 * SECONDS_PER_DAY, TERM, reward));
}

/* ************************************************************************** */

class RewardCalculatorTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;
  DatabaseLedger ledger;
  RewardCalculator rewards;

  BalancesTable balances;
  StakesTable stakes;
  SupplyStats stats;

  std::string token;
  std::string rewardHolding;

  RewardCalculatorTests ()
    : ledger(db, ctx.RoConfig ()->currencies ().token ()),
      rewards(db, ledger, ctx),
      balances(db), stakes(db), stats(db),
      token(ctx.RoConfig ()->currencies ().token ()),
      rewardHolding(ctx.RoConfig ()->holdings ().reward_pool ())
  {
    GlobalStateTable global(db);
    global.Initialise (43, 3);
    SetRewardPool (1'000'000);

    auto s = stakes.CreateNew ("domob");
    s->SetAmount (1'000'000);
    s->SetStartTime (ctx.Timestamp ());
    s->SetLastClaimTime (ctx.Timestamp ());
  }

  /**
   * Sets the reward pool to the given value, both in the global state
   * and as balance of the reward holding.
   */
  void
  SetRewardPool (const Amount val)
  {
    GlobalStateTable global(db);
    global.Get ()->SetRewardPool (val);
    balances.Set (rewardHolding, token, val);
  }

  Amount
  GetRewardPool ()
  {
    GlobalStateTable global(db);
    return global.Get ()->GetRewardPool ();
  }

};

TEST_F (RewardCalculatorTests, Calculate)
{
  ctx.SetTimestamp (ctx.Timestamp () + 90 * SECONDS_PER_DAY);

  Amount reward;
  ASSERT_TRUE (rewards.Calculate ("domob", reward).IsOk ());
  EXPECT_EQ (reward, 215'000);

  /* Calculation has no effect on the state.  */
  ASSERT_TRUE (rewards.Calculate ("domob", reward).IsOk ());
  EXPECT_EQ (reward, 215'000);
  EXPECT_EQ (GetRewardPool (), 1'000'000);
}

TEST_F (RewardCalculatorTests, ClaimPaysCalculatedAmount)
{
  const Timestamp start = ctx.Timestamp ();
  ctx.SetTimestamp (start + 90 * SECONDS_PER_DAY);

  Amount expected;
  ASSERT_TRUE (rewards.Calculate ("domob", expected).IsOk ());
  ASSERT_TRUE (rewards.Claim ("domob").IsOk ());

  EXPECT_EQ (balances.Get (AccountHolding ("domob"), token), expected);
  EXPECT_EQ (balances.Get (rewardHolding, token), 1'000'000 - expected);
  EXPECT_EQ (GetRewardPool (), 1'000'000 - expected);
  EXPECT_EQ (stats.Get ("rewards"), expected);

  auto s = stakes.GetByName ("domob");
  EXPECT_EQ (s->GetLastClaimTime (), start + 90 * SECONDS_PER_DAY);
  EXPECT_EQ (s->GetStartTime (), start);
  EXPECT_EQ (s->GetAmount (), 1'000'000);
}

TEST_F (RewardCalculatorTests, NoTimePassed)
{
  Amount reward;
  EXPECT_EQ (rewards.Calculate ("domob", reward).GetCode (),
             ErrorCode::NO_REWARDS_AVAILABLE);
  EXPECT_EQ (rewards.Claim ("domob").GetCode (),
             ErrorCode::NO_REWARDS_AVAILABLE);

  ctx.SetTimestamp (ctx.Timestamp () + 10);
  ASSERT_TRUE (rewards.Claim ("domob").IsOk ());
  EXPECT_EQ (rewards.Claim ("domob").GetCode (),
             ErrorCode::NO_REWARDS_AVAILABLE);
}

TEST_F (RewardCalculatorTests, NoStake)
{
  ctx.SetTimestamp (ctx.Timestamp () + 10);

  Amount reward;
  EXPECT_EQ (rewards.Calculate ("andy", reward).GetCode (),
             ErrorCode::NO_REWARDS_AVAILABLE);
  EXPECT_EQ (rewards.Claim ("andy").GetCode (),
             ErrorCode::NO_REWARDS_AVAILABLE);
}

TEST_F (RewardCalculatorTests, PoolTooSmall)
{
  SetRewardPool (100'000);
  const Timestamp start = ctx.Timestamp ();
  ctx.SetTimestamp (start + 90 * SECONDS_PER_DAY);

  EXPECT_EQ (rewards.Claim ("domob").GetCode (),
             ErrorCode::INSUFFICIENT_REWARDS);

  EXPECT_EQ (GetRewardPool (), 100'000);
  EXPECT_EQ (balances.Get (AccountHolding ("domob"), token), 0);
  EXPECT_EQ (stakes.GetByName ("domob")->GetLastClaimTime (), start);
}

TEST_F (RewardCalculatorTests, PoolHoldingBelowCounter)
{
  ASSERT_TRUE (ledger.Burn (token, rewardHolding, 900'000).IsOk ());
  const Timestamp start = ctx.Timestamp ();
  ctx.SetTimestamp (start + 90 * SECONDS_PER_DAY);

  EXPECT_EQ (rewards.Claim ("domob").GetCode (),
             ErrorCode::INSUFFICIENT_REWARDS);

  EXPECT_EQ (GetRewardPool (), 1'000'000);
  EXPECT_EQ (balances.Get (rewardHolding, token), 100'000);
  EXPECT_EQ (balances.Get (AccountHolding ("domob"), token), 0);
  EXPECT_EQ (stakes.GetByName ("domob")->GetLastClaimTime (), start);
}

TEST_F (RewardCalculatorTests, ApyChangeApplies)
{
  GlobalStateTable global(db);
  global.Get ()->SetParameters (86, 3);

  ctx.SetTimestamp (ctx.Timestamp () + 90 * SECONDS_PER_DAY);

  Amount reward;
  ASSERT_TRUE (rewards.Calculate ("domob", reward).IsOk ());
  EXPECT_EQ (reward, 430'000);
}

} // anonymous namespace
} // namespace lpd
