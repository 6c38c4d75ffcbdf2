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

#include "unstake.hpp"

#include "database/globalstate.hpp"
#include "database/presale.hpp"
#include "database/stakes.hpp"

#include <glog/logging.h>

namespace lpd
{

OpStatus
UnstakeEngine::Unstake (const std::string& caller)
{
  const Timestamp now = ctx.Timestamp ();
  const auto& params = ctx.Params ();

  PresaleTable presaleTbl(db);
  auto presale = presaleTbl.Get ();
  if (presale != nullptr && presale->HasLaunchTime ())
    {
      const Timestamp launch = presale->GetLaunchTime ();
      if (now < launch || now - launch < params.EarlyUnstakeLock ())
        return OpStatus (ErrorCode::EARLY_UNSTAKE_LOCKED,
                         "unstaking is locked shortly after the launch");
    }

  StakesTable stakesTbl(db);
  auto stake = stakesTbl.GetByName (caller);
  if (stake == nullptr || stake->GetAmount () == 0)
    return OpStatus (ErrorCode::INVALID_AMOUNT, caller + " has no stake");
  const Amount amount = stake->GetAmount ();

  GlobalStateTable globalTbl(db);
  auto global = globalTbl.Get ();
  CHECK (global != nullptr) << "Stake exists without global state";

  Amount newTotal;
  if (!CheckedSub (global->GetTotalStaked (), amount, newTotal))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT,
                     "total staked is less than the stake");

  Amount elapsed;
  if (!CheckedElapsed (stake->GetStartTime (), now, elapsed))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT,
                     "stake starts in the future");

  Amount penalty = 0;
  if (elapsed < static_cast<Amount> (params.StakingDuration ()))
    {
      if (!CheckedMul (amount, params.PenaltyPercent (), penalty)
            || !CheckedDiv (penalty, 100, penalty))
        return OpStatus (ErrorCode::ARITHMETIC_FAULT, "penalty overflows");
    }
  const Amount payout = amount - penalty;

  LOG (INFO)
      << caller << " unstakes " << amount << " after " << elapsed
      << " seconds: payout " << payout << ", penalty " << penalty;

  const auto& cfg = ctx.RoConfig ();
  const std::string& token = cfg->currencies ().token ();
  const std::string& pool = cfg->holdings ().staking_pool ();

  OpStatus res = ledger.Transfer (token, pool, AccountHolding (caller), payout);
  if (!res.IsOk ())
    return res;
  res = ledger.Burn (token, pool, penalty);
  if (!res.IsOk ())
    return res;

  stake->SetAmount (0);
  global->SetTotalStaked (newTotal);

  return OpStatus ();
}

} // namespace lpd
