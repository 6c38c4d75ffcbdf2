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

#include "database/globalstate.hpp"
#include "database/presale.hpp"
#include "database/stakes.hpp"

#include <glog/logging.h>

namespace lpd
{

bool
WeightedStartTime (const Amount oldAmount, const Timestamp oldStart,
                   const Amount amount, const Timestamp now, Timestamp& res)
{
  /* The weighted average (old * s + amount * n) / (old + amount) equals
     s + amount * (n - s) / (old + amount), which avoids the large
     intermediate products.  */

  Amount elapsed;
  if (!CheckedElapsed (oldStart, now, elapsed))
    return false;

  Amount total, shift;
  if (!CheckedAdd (oldAmount, amount, total)
        || !CheckedMul (amount, elapsed, shift)
        || !CheckedDiv (shift, total, shift))
    return false;

  /* shift is at most elapsed, so this stays within [oldStart, now].  */
  res = oldStart + static_cast<Timestamp> (shift);
  return true;
}

OpStatus
StakingEngine::InitialiseGlobalState (const Amount apy,
                                      const Amount feePercent)
{
  GlobalStateTable tbl(db);
  if (tbl.IsInitialised ())
    return OpStatus (ErrorCode::ALREADY_INITIALISED,
                     "global state has already been initialised");

  LOG (INFO)
      << "Initialising global state with APY " << apy
      << " and fee percent " << feePercent;
  tbl.Initialise (apy, feePercent);

  return OpStatus ();
}

OpStatus
StakingEngine::Stake (const std::string& caller, const Amount amount)
{
  PresaleTable presaleTbl(db);
  auto presale = presaleTbl.Get ();
  if (presale == nullptr || !presale->IsActive ())
    return OpStatus (ErrorCode::STAKING_CLOSED, "the presale is not active");

  GlobalStateTable globalTbl(db);
  auto global = globalTbl.Get ();
  if (global == nullptr)
    return OpStatus (ErrorCode::NOT_INITIALISED,
                     "global state has not been initialised");
  if (global->GetRewardPool () == 0)
    return OpStatus (ErrorCode::STAKING_REWARDS_EXHAUSTED,
                     "the reward pool is empty");

  if (amount == 0)
    return OpStatus (ErrorCode::INVALID_AMOUNT, "cannot stake zero");

  StakesTable stakesTbl(db);
  auto stake = stakesTbl.GetByName (caller);
  const Amount oldAmount = (stake == nullptr ? 0 : stake->GetAmount ());

  Amount newAmount, newTotal;
  if (!CheckedAdd (oldAmount, amount, newAmount)
        || !CheckedAdd (global->GetTotalStaked (), amount, newTotal))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT, "staked amount overflows");

  const Timestamp now = ctx.Timestamp ();
  Timestamp startTime = now;
  if (ctx.Params ().StakeClock () == proto::WEIGHTED_AVERAGE
        && oldAmount > 0
        && !WeightedStartTime (oldAmount, stake->GetStartTime (),
                               amount, now, startTime))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT,
                     "vesting start time overflows");

  const auto& cfg = ctx.RoConfig ();
  const OpStatus res
      = ledger.Transfer (cfg->currencies ().token (), AccountHolding (caller),
                         cfg->holdings ().staking_pool (), amount);
  if (!res.IsOk ())
    return res;

  VLOG (1)
      << caller << " stakes " << amount << ", new stake " << newAmount
      << " starting at " << startTime;

  if (stake == nullptr)
    stake = stakesTbl.CreateNew (caller);
  stake->SetAmount (newAmount);
  stake->SetStartTime (startTime);
  stake->SetLastClaimTime (now);
  global->SetTotalStaked (newTotal);

  return OpStatus ();
}

} // namespace lpd
