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

#include "liquidity.hpp"

#include "testutils.hpp"

#include "database/balances.hpp"
#include "database/dbtest.hpp"
#include "database/presale.hpp"

#include <gtest/gtest.h>

namespace lpd
{
namespace
{

class LiquidityLockTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;
  DatabaseLedger ledger;
  LiquidityLock lock;

  BalancesTable balances;
  PresaleTable presale;

  std::string lp;
  std::string source;
  std::string vault;

  LiquidityLockTests ()
    : ledger(db, ctx.RoConfig ()->currencies ().token ()),
      lock(db, ledger, ctx),
      balances(db), presale(db),
      lp(ctx.RoConfig ()->currencies ().liquidity ()),
      source(ctx.RoConfig ()->holdings ().liquidity ()),
      vault(ctx.RoConfig ()->holdings ().vault ())
  {
    presale.Initialise ("admin");
    balances.Set (source, lp, 1'000);
  }

  void
  EndPresale ()
  {
    presale.Get ()->End (ctx.Timestamp (),
                         ctx.Params ().LiquidityLockDuration ());
  }

  bool
  IsLocked ()
  {
    return presale.Get ()->IsLiquidityLocked ();
  }

};

TEST_F (LiquidityLockTests, BeforePresaleEnd)
{
  EXPECT_EQ (lock.Lock ("domob").GetCode (), ErrorCode::LIQUIDITY_LOCK_ERROR);
  EXPECT_FALSE (IsLocked ());
  EXPECT_EQ (balances.Get (source, lp), 1'000);
}

TEST_F (LiquidityLockTests, LocksEverything)
{
  EndPresale ();
  ctx.SetTimestamp (ctx.Timestamp () + 10 * SECONDS_PER_DAY);

  ASSERT_TRUE (lock.Lock ("domob").IsOk ());
  EXPECT_TRUE (IsLocked ());
  EXPECT_EQ (balances.Get (source, lp), 0);
  EXPECT_EQ (balances.Get (vault, lp), 1'000);
}

TEST_F (LiquidityLockTests, AfterDeadline)
{
  const Timestamp end = ctx.Timestamp ();
  EndPresale ();

  ctx.SetTimestamp (end + 365 * SECONDS_PER_DAY - 1);
  ASSERT_TRUE (lock.Lock ("domob").IsOk ());

  balances.Set (source, lp, 50);
  ctx.SetTimestamp (end + 365 * SECONDS_PER_DAY);
  EXPECT_EQ (lock.Lock ("domob").GetCode (), ErrorCode::LIQUIDITY_LOCK_ERROR);
  EXPECT_EQ (balances.Get (source, lp), 50);
}

TEST_F (LiquidityLockTests, NoLiquidity)
{
  EndPresale ();
  balances.Set (source, lp, 0);

  EXPECT_EQ (lock.Lock ("domob").GetCode (), ErrorCode::INVALID_AMOUNT);
  EXPECT_FALSE (IsLocked ());
}

} // anonymous namespace
} // namespace lpd
