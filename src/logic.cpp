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

#include "logic.hpp"

#include "moveprocessor.hpp"
#include "operations.hpp"

#include "database/balances.hpp"
#include "database/globalstate.hpp"
#include "database/lastblock.hpp"
#include "database/schema.hpp"
#include "database/stages.hpp"
#include "database/stakes.hpp"
#include "database/supplystats.hpp"
#include "proto/roconfig.hpp"

#include <glog/logging.h>

namespace lpd
{

SQLiteGameDatabase::SQLiteGameDatabase (xaya::SQLiteDatabase& d)
{
  SetDatabase (d);
}

void
LaunchpadLogic::InitialiseState (Database& db, const Context& ctx)
{
  SupplyStats stats(db);
  stats.InitialiseDatabase ();

  const auto& cfg = ctx.RoConfig ();
  const std::string& admin = cfg->params ().admin ();
  LOG (INFO) << "Initialising the presale state with admin " << admin;

  DatabaseLedger ledger(db, cfg->currencies ().token ());
  Operations ops(db, ledger, ctx);

  /* The initial setup is done through the ordinary operations, so that
     the same checks apply.  Any failure here is a bug in the
     configuration.  */
  OpStatus res = ops.InitialisePresale (admin);
  CHECK (res.IsOk ()) << "Failed to initialise presale: " << res;
  res = ops.InitialiseGlobalState (admin, cfg->params ().initial_apy (),
                                   cfg->params ().initial_fee_percent ());
  CHECK (res.IsOk ()) << "Failed to initialise global state: " << res;
  res = ops.InitialiseStageTable (admin);
  CHECK (res.IsOk ()) << "Failed to initialise stages: " << res;

  const Amount supply = cfg->token ().initial_supply ();
  if (supply > 0)
    {
      res = ledger.Mint (cfg->currencies ().token (),
                         AccountHolding (admin), supply);
      CHECK (res.IsOk ()) << "Failed to mint the initial supply: " << res;
    }
}

void
LaunchpadLogic::UpdateState (Database& db, const xaya::Chain chain,
                             const Json::Value& blockData)
{
  const auto& blockMeta = blockData["block"];
  CHECK (blockMeta.isObject ());
  const auto& heightVal = blockMeta["height"];
  CHECK (heightVal.isUInt64 ());
  const unsigned height = heightVal.asUInt64 ();
  const auto& timestampVal = blockMeta["timestamp"];
  CHECK (timestampVal.isInt64 ());
  const int64_t timestamp = timestampVal.asInt64 ();

  const Context ctx(chain, height, timestamp);
  DatabaseLedger ledger(db, ctx.RoConfig ()->currencies ().token ());
  UpdateState (db, ledger, ctx, blockData);

  LastBlock lb(db);
  lb.Set (height, timestamp);
}

void
LaunchpadLogic::UpdateState (Database& db, Ledger& ledger, const Context& ctx,
                             const Json::Value& blockData)
{
  MoveProcessor mvProc(db, ledger, ctx);
  mvProc.ProcessAdmin (blockData["admin"]);
  mvProc.ProcessAll (blockData["moves"]);

#ifdef ENABLE_SLOW_ASSERTS
  ValidateStateSlow (db, ctx);
#endif // ENABLE_SLOW_ASSERTS
}

Json::Value
LaunchpadLogic::BuildStateJson (Database& db, const xaya::Chain chain)
{
  /* Reads are done as of the last processed block, so that for instance
     claimable rewards are computed for its time.  */
  unsigned height;
  Timestamp timestamp;
  LastBlock lb(db);
  if (!lb.Get (height, timestamp))
    {
      height = Context::NO_HEIGHT;
      timestamp = Context::NO_TIMESTAMP;
    }

  const Context ctx(chain, height, timestamp);
  GameStateJson gsj(db, ctx);

  return gsj.FullState ();
}

void
LaunchpadLogic::SetupSchema (xaya::SQLiteDatabase& db)
{
  SetupDatabaseSchema (db);
}

void
LaunchpadLogic::GetInitialStateBlock (unsigned& height,
                                      std::string& hashHex) const
{
  const xaya::Chain chain = GetChain ();
  const RoConfig cfg(chain);
  CHECK (cfg->has_initial_block ())
      << "No initial block is configured for "
      << xaya::ChainToString (chain);

  height = cfg->initial_block ().height ();
  hashHex = cfg->initial_block ().hash ();
}

void
LaunchpadLogic::InitialiseState (xaya::SQLiteDatabase& db)
{
  SQLiteGameDatabase dbObj(db);
  const Context ctx(GetChain (), Context::NO_HEIGHT, Context::NO_TIMESTAMP);
  InitialiseState (dbObj, ctx);
}

void
LaunchpadLogic::UpdateState (xaya::SQLiteDatabase& db,
                             const Json::Value& blockData)
{
  SQLiteGameDatabase dbObj(db);
  UpdateState (dbObj, GetChain (), blockData);
}

Json::Value
LaunchpadLogic::GetStateAsJson (const xaya::SQLiteDatabase& db)
{
  SQLiteGameDatabase dbObj(const_cast<xaya::SQLiteDatabase&> (db));
  return BuildStateJson (dbObj, GetChain ());
}

namespace
{

/**
 * Verifies that the total staked amount in the global state matches the
 * sum of all stakes.
 */
void
ValidateStakes (Database& db)
{
  GlobalStateTable globalTbl(db);
  auto global = globalTbl.Get ();
  if (global == nullptr)
    return;

  StakesTable stakes(db);
  Amount sum;
  CHECK (stakes.SumAmounts (sum)) << "Sum of stakes overflows";
  CHECK_EQ (sum, global->GetTotalStaked ())
      << "Total staked does not match the sum of stakes";
}

/**
 * Verifies that the total token balance matches the minted and burnt
 * supply statistics.
 */
void
ValidateTokenSupply (Database& db, const Context& ctx)
{
  BalancesTable balances(db);
  Amount total;
  CHECK (balances.SumCurrency (ctx.RoConfig ()->currencies ().token (), total))
      << "Token balances overflow";

  SupplyStats stats(db);
  const Amount minted = stats.Get ("minted");
  const Amount burnt = stats.Get ("burnt");
  CHECK_GE (minted, burnt);
  CHECK_EQ (total, minted - burnt)
      << "Token balances do not match the supply statistics";
}

/**
 * Verifies that the stage table, if initialised, has all stages.
 */
void
ValidateStages (Database& db)
{
  PresaleStageTable tbl(db);
  if (!tbl.IsInitialised ())
    return;

  const auto stages = tbl.GetAll ();
  CHECK_EQ (stages.size (), PresaleStageTable::NUM_STAGES);
  for (unsigned i = 0; i < stages.size (); ++i)
    {
      CHECK_EQ (stages[i].index, i);
      CHECK_EQ (stages[i].stage, i + 1);
    }
}

} // anonymous namespace

void
LaunchpadLogic::ValidateStateSlow (Database& db, const Context& ctx)
{
  LOG (INFO) << "Performing slow validation of the game-state database...";

  ValidateStakes (db);
  ValidateTokenSupply (db, ctx);
  ValidateStages (db);
}

} // namespace lpd
