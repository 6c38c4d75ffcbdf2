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

#ifndef LPD_STAKING_HPP
#define LPD_STAKING_HPP

#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"

#include <string>

namespace lpd
{

/**
 * Computes the new start time of a stake when amount is added to an
 * existing stake of oldAmount that started at oldStart, according to the
 * amount-weighted average (rounded down).  Returns false if the
 * computation overflows.
 */
bool WeightedStartTime (Amount oldAmount, Timestamp oldStart,
                        Amount amount, Timestamp now, Timestamp& res);

/**
 * The staking side of the economy:  Depositors lock tokens into the
 * staking pool while the presale is active, and the global aggregates
 * are kept in sync with the individual stakes.
 */
class StakingEngine
{

private:

  Database& db;
  Ledger& ledger;
  const Context& ctx;

public:

  explicit StakingEngine (Database& d, Ledger& l, const Context& c)
    : db(d), ledger(l), ctx(c)
  {}

  StakingEngine () = delete;
  StakingEngine (const StakingEngine&) = delete;
  void operator= (const StakingEngine&) = delete;

  /**
   * Creates the global state with zero aggregates and the given rates.
   * This can only be done once.
   */
  OpStatus InitialiseGlobalState (Amount apy, Amount feePercent);

  /**
   * Stakes the given amount of tokens for the caller.
   */
  OpStatus Stake (const std::string& caller, Amount amount);

};

} // namespace lpd

#endif // LPD_STAKING_HPP
