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

#include "moveprocessor.hpp"

#include "jsonutils.hpp"
#include "testutils.hpp"

#include "database/balances.hpp"
#include "database/dbtest.hpp"
#include "database/globalstate.hpp"
#include "database/presale.hpp"
#include "database/stages.hpp"
#include "database/stakes.hpp"
#include "database/supplystats.hpp"

#include <gtest/gtest.h>

#include <glog/logging.h>

#include <json/json.h>

#include <string>

namespace lpd
{
namespace
{

class MoveProcessorTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;
  DatabaseLedger ledger;

private:

  MoveProcessor mvProc;

protected:

  BalancesTable balances;
  StakesTable stakes;

  std::string native;
  std::string token;

  MoveProcessorTests ()
    : ledger(db, ctx.RoConfig ()->currencies ().token ()),
      mvProc(db, ledger, ctx),
      balances(db), stakes(db),
      native(ctx.RoConfig ()->currencies ().native ()),
      token(ctx.RoConfig ()->currencies ().token ())
  {
    Operations ops(db, ledger, ctx);
    CHECK (ops.InitialisePresale ("admin").IsOk ());
    CHECK (ops.InitialiseGlobalState ("admin", 43, 3).IsOk ());
    CHECK (ops.InitialiseStageTable ("admin").IsOk ());

    CHECK (ledger.Mint (token, AccountHolding ("admin"), 10'000'000).IsOk ());
    CHECK (ledger.Mint (token, AccountHolding ("domob"), 1'000'000).IsOk ());
  }

  /**
   * Processes an array of admin commands given as JSON string.
   */
  void
  ProcessAdmin (const std::string& str)
  {
    mvProc.ProcessAdmin (ParseJson (str));
  }

  /**
   * Processes the given data (which is passed as string and converted to
   * JSON before processing it).
   */
  void
  Process (const std::string& str)
  {
    mvProc.ProcessAll (ParseJson (str));
  }

  /**
   * Processes a single move by the given name, with an optional payment
   * of CHI to the presale address.
   */
  void
  ProcessMove (const std::string& name, const std::string& mv,
               const std::string& chi = "")
  {
    Json::Value moveObj(Json::objectValue);
    moveObj["name"] = name;
    moveObj["move"] = ParseJson (mv);
    if (!chi.empty ())
      moveObj["out"][ctx.RoConfig ()->params ().presale_address ()]
          = ParseJson (chi);

    Json::Value arr(Json::arrayValue);
    arr.append (moveObj);
    mvProc.ProcessAll (arr);
  }

  Amount
  Balance (const std::string& name, const std::string& currency)
  {
    return balances.Get (AccountHolding (name), currency);
  }

  GlobalStateTable::Handle
  GetGlobal ()
  {
    GlobalStateTable tbl(db);
    return tbl.Get ();
  }

};

/* ************************************************************************** */

TEST_F (MoveProcessorTests, InvalidDataFromXaya)
{
  EXPECT_DEATH (Process ("{}"), "isArray");

  EXPECT_DEATH (Process (R"(
    [{"name": "domob"}]
  )"), "isMember.*move");

  EXPECT_DEATH (Process (R"(
    [{"move": {}}]
  )"), "nameVal.isString");
  EXPECT_DEATH (Process (R"(
    [{"name": 5, "move": {}}]
  )"), "nameVal.isString");

  EXPECT_DEATH (Process (R"([{
    "name": "domob", "move": {},
    "out": {")" + ctx.RoConfig ()->params ().presale_address ()
                + R"(": false}
  }])"), "ChiFromJson");
}

TEST_F (MoveProcessorTests, InvalidAdminFromXaya)
{
  EXPECT_DEATH (ProcessAdmin ("42"), "isArray");
  EXPECT_DEATH (ProcessAdmin ("null"), "isArray");
  EXPECT_DEATH (ProcessAdmin ("{}"), "isArray");
  EXPECT_DEATH (ProcessAdmin ("[5]"), "isObject");
}

TEST_F (MoveProcessorTests, ChiPaymentCredited)
{
  ProcessMove ("andy", "{}", "1.5");
  EXPECT_EQ (Balance ("andy", native), 150'000'000);

  /* The coins are credited also for an invalid move.  */
  ProcessMove ("andy", "42", "0.5");
  EXPECT_EQ (Balance ("andy", native), 200'000'000);
}

TEST_F (MoveProcessorTests, Payment)
{
  ProcessMove ("domob", R"({
    "pay": {"amount": 1000, "currency": "chi"}
  })", "0.00001");

  const auto& holdings = ctx.RoConfig ()->holdings ();
  EXPECT_EQ (Balance ("domob", native), 0);
  EXPECT_EQ (balances.Get (holdings.treasury (), native), 997);
  EXPECT_EQ (balances.Get (holdings.fee_recipient (), native), 3);

  ProcessMove ("domob", R"({
    "pay":
      {
        "amount": 100, "currency": "brats",
        "treasury": "presale/treasury", "fee": "presale/fees"
      }
  })");
  EXPECT_EQ (balances.Get (holdings.treasury (), token), 97);
  EXPECT_EQ (Balance ("domob", token), 1'000'000 - 100);
}

TEST_F (MoveProcessorTests, InvalidPayment)
{
  for (const std::string mv : {
          R"({"pay": 100})",
          R"({"pay": {"currency": "brats"}})",
          R"({"pay": {"amount": -5, "currency": "brats"}})",
          R"({"pay": {"amount": 100}})",
          R"({"pay": {"amount": 100, "currency": 5}})",
          R"({"pay": {"amount": 100, "currency": "brats", "fee": 1}})",
          R"({"pay": {"amount": 100, "currency": "brats", "fee": "p/x"}})",
          R"({"pay": {"amount": 100, "currency": "foo"}})",
          R"({"pay": {"amount": 3, "currency": "brats"}})",
       })
    ProcessMove ("domob", mv);

  EXPECT_EQ (Balance ("domob", token), 1'000'000);
}

TEST_F (MoveProcessorTests, Deposit)
{
  ProcessMove ("domob", R"({"deposit": 1000})", "0.00002");
  EXPECT_EQ (Balance ("domob", native), 1'000);
  EXPECT_EQ (balances.Get (ctx.RoConfig ()->holdings ().treasury (), native),
             1'000);

  ProcessMove ("domob", R"({"deposit": "1000"})");
  ProcessMove ("domob", R"({"deposit": 1001})");
  EXPECT_EQ (Balance ("domob", native), 1'000);
}

TEST_F (MoveProcessorTests, StakeClaimUnstake)
{
  ProcessMove ("admin", R"({"adm": {"refill": 1000000}})");
  EXPECT_EQ (GetGlobal ()->GetRewardPool (), 1'000'000);

  const Timestamp start = ctx.Timestamp ();
  ProcessMove ("domob", R"({"stake": 1000000})");
  EXPECT_EQ (stakes.GetByName ("domob")->GetAmount (), 1'000'000);
  EXPECT_EQ (GetGlobal ()->GetTotalStaked (), 1'000'000);

  ctx.SetTimestamp (start + 90 * SECONDS_PER_DAY);
  ProcessMove ("domob", R"({"claim": {}})");
  EXPECT_EQ (Balance ("domob", token), 215'000);

  ProcessMove ("domob", R"({"unstake": {}})");
  EXPECT_EQ (Balance ("domob", token), 215'000 + 800'000);
  EXPECT_EQ (GetGlobal ()->GetTotalStaked (), 0);
}

TEST_F (MoveProcessorTests, OrderWithinMove)
{
  ProcessMove ("admin", R"({"adm": {"refill": 1000}})");

  /* The stake is processed before the unstake, so both work in the
     same move.  */
  ProcessMove ("domob", R"({"unstake": {}, "stake": 500})");
  EXPECT_EQ (stakes.GetByName ("domob")->GetAmount (), 0);
  EXPECT_EQ (Balance ("domob", token), 1'000'000 - 100);
}

TEST_F (MoveProcessorTests, FailedPartDoesNotStopOthers)
{
  ProcessMove ("domob", R"({"stake": 0, "deposit": 0, "claim": {}})", "1");

  ProcessMove ("domob", R"({"stake": 100, "deposit": 500})");
  EXPECT_EQ (stakes.GetByName ("domob"), nullptr);
  EXPECT_EQ (Balance ("domob", native), 100'000'000 - 500);
}

TEST_F (MoveProcessorTests, AdminOperations)
{
  ProcessMove ("admin", R"({
    "adm":
      {
        "params": {"apy": 50, "fee": 5},
        "refill": 5000,
        "burn": {"holding": "p/domob", "amount": 1000},
        "stage": {"index": 2, "price": 1, "sold": 2, "raised": 3}
      }
  })");

  auto g = GetGlobal ();
  EXPECT_EQ (g->GetApy (), 50);
  EXPECT_EQ (g->GetFeePercent (), 5);
  EXPECT_EQ (g->GetRewardPool (), 5'000);
  g.reset ();

  EXPECT_EQ (Balance ("domob", token), 999'000);

  PresaleStageTable stages(db);
  PresaleStage s;
  ASSERT_TRUE (stages.Get (2, s));
  EXPECT_EQ (s.price, 1);
  EXPECT_EQ (s.tokensSold, 2);
  EXPECT_EQ (s.totalRaised, 3);
}

TEST_F (MoveProcessorTests, AdminOperationsByNonAdmin)
{
  ProcessMove ("domob", R"({
    "adm":
      {
        "end": {},
        "params": {"apy": 50, "fee": 5},
        "burn": {"holding": "p/admin", "amount": 1000}
      }
  })");

  EXPECT_EQ (GetGlobal ()->GetApy (), 43);
  EXPECT_EQ (Balance ("admin", token), 10'000'000);

  PresaleTable presale(db);
  EXPECT_TRUE (presale.Get ()->IsActive ());
}

TEST_F (MoveProcessorTests, WithdrawAndEnd)
{
  ProcessMove ("domob", R"({"deposit": 1000})", "0.00001");

  ProcessMove ("admin", R"({"adm": {"withdraw": 400, "end": {}}})");

  /* The presale end is processed first, so the withdrawal fails.  */
  EXPECT_EQ (Balance ("admin", native), 0);

  PresaleTable presale(db);
  auto p = presale.Get ();
  EXPECT_FALSE (p->IsActive ());
  EXPECT_EQ (p->GetLaunchTime (), ctx.Timestamp ());
}

TEST_F (MoveProcessorTests, LiquidityLock)
{
  const auto& cfg = ctx.RoConfig ();
  const std::string lp = cfg->currencies ().liquidity ();
  ASSERT_TRUE (ledger.Mint (lp, cfg->holdings ().liquidity (), 100).IsOk ());

  ProcessMove ("domob", R"({"lock": {}})");
  EXPECT_EQ (balances.Get (cfg->holdings ().vault (), lp), 0);

  ProcessMove ("admin", R"({"adm": {"end": {}}})");
  ProcessMove ("domob", R"({"lock": {}})");
  EXPECT_EQ (balances.Get (cfg->holdings ().vault (), lp), 100);
}

TEST_F (MoveProcessorTests, ProvideAndLockLiquidity)
{
  const auto& cfg = ctx.RoConfig ();
  const std::string lp = cfg->currencies ().liquidity ();

  ProcessMove ("domob", R"({"adm": {"liquidity": 100}})");
  EXPECT_EQ (balances.Get (cfg->holdings ().liquidity (), lp), 0);

  ProcessMove ("admin", R"({"adm": {"liquidity": 1000, "end": {}}})");
  EXPECT_EQ (balances.Get (cfg->holdings ().liquidity (), lp), 1'000);
  EXPECT_EQ (Balance ("admin", lp), 10'000'000 - 1'000);

  ProcessMove ("domob", R"({"lock": {}})");
  EXPECT_EQ (balances.Get (cfg->holdings ().liquidity (), lp), 0);
  EXPECT_EQ (balances.Get (cfg->holdings ().vault (), lp), 1'000);

  PresaleTable presale(db);
  EXPECT_TRUE (presale.Get ()->IsLiquidityLocked ());
}

/* ************************************************************************** */

TEST_F (MoveProcessorTests, TokenTransfer)
{
  ProcessMove ("admin", R"({"vc": {"t": {"andy": 5000, "daniel": 10}}})");
  EXPECT_EQ (Balance ("admin", token), 10'000'000 - 5'010);
  EXPECT_EQ (Balance ("andy", token), 5'000);
  EXPECT_EQ (Balance ("daniel", token), 10);

  ProcessMove ("andy", R"({"vc": {"t": {"domob": 1000}}})");
  EXPECT_EQ (Balance ("andy", token), 4'000);
  EXPECT_EQ (Balance ("domob", token), 1'001'000);
}

TEST_F (MoveProcessorTests, TransfersAreIndependent)
{
  ProcessMove ("admin", R"({"vc": {"t": {"andy": 100}}})");

  /* Recipients are processed in sorted order.  The transfer to "bob"
     goes through, the one to "charlie" would overdraw.  */
  ProcessMove ("andy", R"({"vc": {"t": {"charlie": 50, "bob": 60}}})");
  EXPECT_EQ (Balance ("andy", token), 40);
  EXPECT_EQ (Balance ("bob", token), 60);
  EXPECT_EQ (Balance ("charlie", token), 0);
}

TEST_F (MoveProcessorTests, InvalidTokenTransfer)
{
  ProcessMove ("domob", R"({"vc": {"t": {"andy": -5, "bob": "10"}}})");
  ProcessMove ("domob", R"({"vc": {"t": {"": 10}}})");
  ProcessMove ("domob", R"({"vc": {"t": {"andy": 0}}})");
  ProcessMove ("domob", R"({"vc": {"t": [10]}})");
  ProcessMove ("domob", R"({"vc": "andy"})");
  ProcessMove ("domob", R"({"vc": {"t": {"andy": 1000001}}})");

  EXPECT_EQ (Balance ("domob", token), 1'000'000);
  EXPECT_EQ (Balance ("andy", token), 0);
  EXPECT_EQ (Balance ("bob", token), 0);
}

TEST_F (MoveProcessorTests, BurnOwnTokens)
{
  ProcessMove ("domob", R"({"vc": {"b": 300, "t": {"andy": 700}}})");
  EXPECT_EQ (Balance ("domob", token), 1'000'000 - 1'000);
  EXPECT_EQ (Balance ("andy", token), 700);
  EXPECT_EQ (SupplyStats (db).Get ("burnt"), 300);

  ProcessMove ("andy", R"({"vc": {"b": 701}})");
  ProcessMove ("andy", R"({"vc": {"b": "1"}})");
  EXPECT_EQ (Balance ("andy", token), 700);
  EXPECT_EQ (SupplyStats (db).Get ("burnt"), 300);
}

TEST_F (MoveProcessorTests, StakeAfterReceivingTokens)
{
  ProcessMove ("admin", R"({"adm": {"refill": 1000000}})");

  ProcessMove ("andy", R"({"stake": 500000})");
  EXPECT_EQ (stakes.GetByName ("andy"), nullptr);

  ProcessMove ("admin", R"({"vc": {"t": {"andy": 500000}}})");
  const Timestamp start = ctx.Timestamp ();
  ProcessMove ("andy", R"({"stake": 500000})");
  EXPECT_EQ (stakes.GetByName ("andy")->GetAmount (), 500'000);
  EXPECT_EQ (Balance ("andy", token), 0);

  ctx.SetTimestamp (start + 90 * SECONDS_PER_DAY);
  ProcessMove ("andy", R"({"claim": {}})");
  EXPECT_EQ (Balance ("andy", token), 107'500);
}

/* ************************************************************************** */

TEST_F (MoveProcessorTests, GodMint)
{
  ProcessAdmin (R"([{"cmd": {
    "god":
      {
        "mint":
          [
            {"currency": "brats", "holding": "p/andy", "amount": 42},
            {"currency": "chi", "holding": "p/andy", "amount": -1},
            {"currency": "lp", "holding": "presale/liquidity", "amount": 10}
          ]
      }
  }}])");

  EXPECT_EQ (Balance ("andy", token), 42);
  EXPECT_EQ (Balance ("andy", native), 0);
  EXPECT_EQ (balances.Get ("presale/liquidity", "lp"), 10);
}

TEST_F (MoveProcessorTests, GodModeDisabled)
{
  ctx.SetGodMode (false);
  ProcessAdmin (R"([{"cmd": {
    "god": {"mint": [{"currency": "brats", "holding": "p/andy", "amount": 42}]}
  }}])");

  EXPECT_EQ (Balance ("andy", token), 0);
}

} // anonymous namespace
} // namespace lpd
