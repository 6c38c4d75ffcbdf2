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

#include "database/globalstate.hpp"
#include "database/stakes.hpp"
#include "database/supplystats.hpp"

#include <glog/logging.h>

#include <sstream>

namespace lpd
{

bool
ComputeReward (const Amount amount, const Amount apy, const Amount dt,
               const Timestamp duration, Amount& reward)
{
  CHECK_GT (duration, 0);

  Amount numerator, denominator;
  if (!CheckedMul (amount, apy, numerator)
        || !CheckedMul (numerator, dt, numerator)
        || !CheckedMul (100, static_cast<Amount> (duration), denominator))
    return false;

  return CheckedDiv (numerator, denominator, reward);
}

OpStatus
RewardCalculator::Calculate (const std::string& caller, Amount& reward)
{
  StakesTable stakesTbl(db);
  auto stake = stakesTbl.GetByName (caller);
  if (stake == nullptr)
    return OpStatus (ErrorCode::NO_REWARDS_AVAILABLE,
                     caller + " has never staked");

  const Timestamp now = ctx.Timestamp ();
  if (now <= stake->GetLastClaimTime ())
    return OpStatus (ErrorCode::NO_REWARDS_AVAILABLE,
                     "no time has passed since the last claim");
  const Amount dt = now - stake->GetLastClaimTime ();

  GlobalStateTable globalTbl(db);
  auto global = globalTbl.Get ();
  CHECK (global != nullptr) << "Stake exists without global state";

  if (!ComputeReward (stake->GetAmount (), global->GetApy (), dt,
                      ctx.Params ().StakingDuration (), reward))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT, "reward overflows");

  VLOG (1)
      << "Reward for " << caller << " after " << dt << " seconds: "
      << reward;

  return OpStatus ();
}

OpStatus
RewardCalculator::Claim (const std::string& caller)
{
  Amount reward;
  const OpStatus calc = Calculate (caller, reward);
  if (!calc.IsOk ())
    return calc;

  GlobalStateTable globalTbl(db);
  auto global = globalTbl.Get ();

  Amount newPool;
  if (!CheckedSub (global->GetRewardPool (), reward, newPool))
    {
      std::ostringstream msg;
      msg << "reward of " << reward << " exceeds the pool of "
          << global->GetRewardPool ();
      return OpStatus (ErrorCode::INSUFFICIENT_REWARDS, msg.str ());
    }

  /* The pool's counter and its ledger balance can diverge, e.g. if the
     admin burns tokens from the pool holding.  Both must cover the
     reward.  */
  const auto& cfg = ctx.RoConfig ();
  const std::string& token = cfg->currencies ().token ();
  const std::string& pool = cfg->holdings ().reward_pool ();
  const Amount poolBalance = ledger.GetBalance (token, pool);
  if (poolBalance < reward)
    {
      std::ostringstream msg;
      msg << "reward of " << reward << " exceeds the pool balance of "
          << poolBalance;
      return OpStatus (ErrorCode::INSUFFICIENT_REWARDS, msg.str ());
    }

  const OpStatus res
      = ledger.Transfer (token, pool, AccountHolding (caller), reward);
  if (!res.IsOk ())
    return res;

  SupplyStats stats(db);
  if (reward > 0 && !stats.Increment ("rewards", reward))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT, "reward total overflows");

  LOG (INFO) << caller << " claims reward of " << reward;

  StakesTable stakesTbl(db);
  stakesTbl.GetByName (caller)->SetLastClaimTime (ctx.Timestamp ());
  global->SetRewardPool (newPool);

  return OpStatus ();
}

} // namespace lpd
