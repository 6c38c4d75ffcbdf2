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

#ifndef LPD_REWARDS_HPP
#define LPD_REWARDS_HPP

#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"

#include <string>

namespace lpd
{

/**
 * Computes the reward for a stake of the given amount at the given APY
 * (in percent) over dt seconds, where the APY is paid out over the full
 * staking duration:  floor (amount * apy * dt / (100 * duration)).
 * Returns false if the computation overflows.
 */
bool ComputeReward (Amount amount, Amount apy, Amount dt, Timestamp duration,
                    Amount& reward);

/**
 * Computes and pays out staking rewards from the reward pool.
 */
class RewardCalculator
{

private:

  Database& db;
  Ledger& ledger;
  const Context& ctx;

public:

  explicit RewardCalculator (Database& d, Ledger& l, const Context& c)
    : db(d), ledger(l), ctx(c)
  {}

  RewardCalculator () = delete;
  RewardCalculator (const RewardCalculator&) = delete;
  void operator= (const RewardCalculator&) = delete;

  /**
   * Computes the rewards the caller could claim right now, without
   * changing anything.
   */
  OpStatus Calculate (const std::string& caller, Amount& reward);

  /**
   * Pays out the caller's current rewards and restarts their
   * reward period.
   */
  OpStatus Claim (const std::string& caller);

};

} // namespace lpd

#endif // LPD_REWARDS_HPP
