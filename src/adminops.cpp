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

#include "adminops.hpp"

#include "database/globalstate.hpp"
#include "database/presale.hpp"
#include "database/stages.hpp"

#include <glog/logging.h>

#include <sstream>
#include <vector>

namespace lpd
{

OpStatus
AdminOps::CheckAuthorised (const std::string& caller, const std::string& op)
{
  if (auth.IsAuthorised (caller))
    return OpStatus ();

  return OpStatus (ErrorCode::UNAUTHORIZED,
                   caller + " is not allowed to " + op);
}

OpStatus
AdminOps::BurnTokens (const std::string& caller, const std::string& holding,
                      const Amount amount)
{
  const OpStatus authStatus = CheckAuthorised (caller, "burn tokens");
  if (!authStatus.IsOk ())
    return authStatus;

  LOG (INFO) << caller << " burns " << amount << " tokens from " << holding;
  return ledger.Burn (ctx.RoConfig ()->currencies ().token (),
                      holding, amount);
}

OpStatus
AdminOps::RefillRewardPool (const std::string& caller, const Amount amount)
{
  const OpStatus authStatus = CheckAuthorised (caller, "refill rewards");
  if (!authStatus.IsOk ())
    return authStatus;

  GlobalStateTable globalTbl(db);
  auto global = globalTbl.Get ();
  if (global == nullptr)
    return OpStatus (ErrorCode::NOT_INITIALISED,
                     "global state has not been initialised");

  Amount newPool;
  if (!CheckedAdd (global->GetRewardPool (), amount, newPool))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT, "reward pool overflows");

  const auto& cfg = ctx.RoConfig ();
  const OpStatus res
      = ledger.Transfer (cfg->currencies ().token (), AccountHolding (caller),
                         cfg->holdings ().reward_pool (), amount);
  if (!res.IsOk ())
    return res;

  LOG (INFO) << caller << " refills the reward pool by " << amount;
  global->SetRewardPool (newPool);

  return OpStatus ();
}

OpStatus
AdminOps::ProvideLiquidity (const std::string& caller, const Amount amount)
{
  const OpStatus authStatus = CheckAuthorised (caller, "provide liquidity");
  if (!authStatus.IsOk ())
    return authStatus;

  if (amount == 0)
    return OpStatus (ErrorCode::INVALID_AMOUNT, "cannot provide zero");

  const auto& cfg = ctx.RoConfig ();
  const OpStatus res
      = ledger.Transfer (cfg->currencies ().liquidity (),
                         AccountHolding (caller),
                         cfg->holdings ().liquidity (), amount);
  if (!res.IsOk ())
    return res;

  LOG (INFO) << caller << " provides " << amount << " liquidity";

  return OpStatus ();
}

OpStatus
AdminOps::UpdateParameters (const std::string& caller, const Amount apy,
                            const Amount feePercent)
{
  const OpStatus authStatus = CheckAuthorised (caller, "update parameters");
  if (!authStatus.IsOk ())
    return authStatus;

  GlobalStateTable globalTbl(db);
  auto global = globalTbl.Get ();
  if (global == nullptr)
    return OpStatus (ErrorCode::NOT_INITIALISED,
                     "global state has not been initialised");

  LOG (INFO)
      << caller << " sets APY to " << apy
      << " and fee percent to " << feePercent;
  global->SetParameters (apy, feePercent);

  return OpStatus ();
}

OpStatus
AdminOps::WithdrawFunds (const std::string& caller, const Amount amount)
{
  const OpStatus authStatus = CheckAuthorised (caller, "withdraw funds");
  if (!authStatus.IsOk ())
    return authStatus;

  PresaleTable presaleTbl(db);
  auto presale = presaleTbl.Get ();
  if (presale == nullptr || !presale->IsActive ())
    return OpStatus (ErrorCode::WITHDRAWAL_NOT_ALLOWED,
                     "withdrawals are only possible during the presale");

  const auto& cfg = ctx.RoConfig ();
  LOG (INFO) << caller << " withdraws " << amount << " from the treasury";
  return ledger.Transfer (cfg->currencies ().native (),
                          cfg->holdings ().treasury (),
                          AccountHolding (caller), amount);
}

OpStatus
AdminOps::InitialiseStageTable (const std::string& caller)
{
  const OpStatus authStatus = CheckAuthorised (caller, "initialise stages");
  if (!authStatus.IsOk ())
    return authStatus;

  PresaleStageTable tbl(db);
  if (tbl.IsInitialised ())
    return OpStatus (ErrorCode::ALREADY_INITIALISED,
                     "stage table has already been initialised");

  std::vector<PresaleStage> schedule;
  for (const auto& s : ctx.RoConfig ()->stages ())
    {
      PresaleStage stage;
      stage.price = s.price ();
      stage.tokensSold = s.tokens_sold ();
      stage.totalRaised = s.total_raised ();
      schedule.push_back (stage);
    }

  LOG (INFO) << "Initialising " << schedule.size () << " presale stages";
  tbl.Initialise (schedule);

  return OpStatus ();
}

OpStatus
AdminOps::UpdatePresaleStage (const std::string& caller, const unsigned index,
                              const Amount price, const Amount tokensSold,
                              const Amount totalRaised)
{
  const OpStatus authStatus = CheckAuthorised (caller, "update stages");
  if (!authStatus.IsOk ())
    return authStatus;

  PresaleStageTable tbl(db);
  if (!tbl.IsInitialised ())
    return OpStatus (ErrorCode::NOT_INITIALISED,
                     "stage table has not been initialised");

  if (!tbl.Update (index, price, tokensSold, totalRaised))
    {
      std::ostringstream msg;
      msg << "stage index " << index << " is out of range";
      return OpStatus (ErrorCode::INVALID_STAGE_INDEX, msg.str ());
    }

  return OpStatus ();
}

} // namespace lpd
