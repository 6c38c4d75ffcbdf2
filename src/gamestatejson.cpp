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

#include "gamestatejson.hpp"

#include "jsonutils.hpp"
#include "ledger.hpp"
#include "operations.hpp"

#include "database/balances.hpp"
#include "database/globalstate.hpp"
#include "database/lastblock.hpp"
#include "database/presale.hpp"
#include "database/stages.hpp"
#include "database/stakes.hpp"
#include "database/supplystats.hpp"
#include "proto/roconfig.hpp"

#include <glog/logging.h>

namespace lpd
{

template <>
  Json::Value
  GameStateJson::Convert<StakeAccount> (const StakeAccount& s) const
{
  Json::Value res(Json::objectValue);
  res["name"] = s.GetName ();
  res["amount"] = IntToJson (s.GetAmount ());
  res["starttime"] = IntToJson (s.GetStartTime ());
  res["lastclaim"] = IntToJson (s.GetLastClaimTime ());

  return res;
}

template <>
  Json::Value
  GameStateJson::Convert<PresaleStage> (const PresaleStage& s) const
{
  Json::Value res(Json::objectValue);
  res["index"] = IntToJson (s.index);
  res["stage"] = IntToJson (s.stage);
  res["price"] = IntToJson (s.price);
  res["sold"] = IntToJson (s.tokensSold);
  res["raised"] = IntToJson (s.totalRaised);

  return res;
}

template <typename T, typename R>
  Json::Value
  GameStateJson::ResultsAsArray (T& tbl, Database::Result<R> res) const
{
  Json::Value arr(Json::arrayValue);

  while (res.Step ())
    {
      const auto h = tbl.GetFromResult (res);
      arr.append (Convert (*h));
    }

  return arr;
}

Json::Value
GameStateJson::Presale ()
{
  PresaleTable tbl(db);
  if (!tbl.IsInitialised ())
    return Json::Value ();

  const auto p = tbl.Get ();

  Json::Value res(Json::objectValue);
  res["active"] = p->IsActive ();
  res["admin"] = p->GetAdmin ();
  if (p->HasEndTime ())
    res["endtime"] = IntToJson (p->GetEndTime ());
  if (p->HasLaunchTime ())
    res["launchtime"] = IntToJson (p->GetLaunchTime ());

  Json::Value liquidity(Json::objectValue);
  liquidity["locked"] = p->IsLiquidityLocked ();
  if (p->HasLiquidityLockEnd ())
    liquidity["lockend"] = IntToJson (p->GetLiquidityLockEnd ());
  res["liquidity"] = liquidity;

  return res;
}

Json::Value
GameStateJson::Global ()
{
  GlobalStateTable tbl(db);
  if (!tbl.IsInitialised ())
    return Json::Value ();

  const auto g = tbl.Get ();

  Json::Value res(Json::objectValue);
  res["totalstaked"] = IntToJson (g->GetTotalStaked ());
  res["rewardpool"] = IntToJson (g->GetRewardPool ());
  res["apy"] = IntToJson (g->GetApy ());
  res["feepercent"] = IntToJson (g->GetFeePercent ());

  return res;
}

Json::Value
GameStateJson::Stages ()
{
  PresaleStageTable tbl(db);

  Json::Value res(Json::arrayValue);
  for (const auto& s : tbl.GetAll ())
    res.append (Convert (s));

  return res;
}

Json::Value
GameStateJson::Stakes ()
{
  StakesTable tbl(db);
  Json::Value res = ResultsAsArray (tbl, tbl.QueryAll ());

  if (!ctx.HasTimestamp ())
    return res;

  /* The claimable reward is what a claim at the context's time (i.e. in
     a block with the last block's timestamp) would pay out.  */
  DatabaseLedger ledger(db, ctx.RoConfig ()->currencies ().token ());
  Operations ops(db, ledger, ctx);
  for (auto& entry : res)
    {
      const std::string name = entry["name"].asString ();

      Amount reward;
      const OpStatus status = ops.CalculateRewards (name, reward);
      if (!status.IsOk ())
        {
          if (status.GetCode () != ErrorCode::NO_REWARDS_AVAILABLE)
            LOG (WARNING)
                << "Failed to calculate rewards of " << name << ": "
                << status;
          reward = 0;
        }

      entry["claimable"] = IntToJson (reward);
    }

  return res;
}

Json::Value
GameStateJson::Balances ()
{
  BalancesTable tbl(db);

  Json::Value res(Json::objectValue);
  auto q = tbl.QueryAll ();
  while (q.Step ())
    {
      const std::string holding = q.Get<BalanceResult::holding> ();
      const std::string currency = q.Get<BalanceResult::currency> ();
      const Amount amount
          = AmountFromColumn (q.Get<BalanceResult::amount> ());
      res[holding][currency] = IntToJson (amount);
    }

  return res;
}

Json::Value
GameStateJson::Supply ()
{
  SupplyStats stats(db);

  Json::Value res(Json::objectValue);
  for (const auto& key : SupplyStats::GetValidKeys ())
    res[key] = IntToJson (stats.Get (key));

  return res;
}

Json::Value
GameStateJson::Token ()
{
  const auto& token = ctx.RoConfig ()->token ();

  Json::Value res(Json::objectValue);
  res["name"] = token.name ();
  res["symbol"] = token.symbol ();
  res["currency"] = ctx.RoConfig ()->currencies ().token ();

  SupplyStats stats(db);
  const Amount minted = stats.Get ("minted");
  const Amount burnt = stats.Get ("burnt");
  CHECK_GE (minted, burnt) << "More tokens burnt than minted";
  res["supply"] = IntToJson (minted - burnt);

  return res;
}

Json::Value
GameStateJson::Block ()
{
  LastBlock lb(db);
  unsigned height;
  Timestamp timestamp;
  if (!lb.Get (height, timestamp))
    return Json::Value ();

  Json::Value res(Json::objectValue);
  res["height"] = IntToJson (height);
  res["timestamp"] = IntToJson (timestamp);

  return res;
}

Json::Value
GameStateJson::FullState ()
{
  Json::Value res(Json::objectValue);

  res["block"] = Block ();

  res["presale"] = Presale ();
  res["global"] = Global ();
  res["stages"] = Stages ();
  res["stakes"] = Stakes ();
  res["balances"] = Balances ();
  res["supply"] = Supply ();
  res["token"] = Token ();

  return res;
}

} // namespace lpd
