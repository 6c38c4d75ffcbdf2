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

#ifndef LPD_ADMINOPS_HPP
#define LPD_ADMINOPS_HPP

#include "authorisation.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"

#include <string>

namespace lpd
{

/**
 * Privileged operations of the presale.  All of them first check the
 * caller against the authorisation policy, and fail with UNAUTHORIZED
 * without changing anything if that check fails.
 */
class AdminOps
{

private:

  Database& db;
  Ledger& ledger;
  AuthorisationPolicy& auth;
  const Context& ctx;

  /**
   * Returns an UNAUTHORIZED error if the caller is not authorised, and
   * success otherwise.
   */
  OpStatus CheckAuthorised (const std::string& caller,
                            const std::string& op);

public:

  explicit AdminOps (Database& d, Ledger& l, AuthorisationPolicy& a,
                     const Context& c)
    : db(d), ledger(l), auth(a), ctx(c)
  {}

  AdminOps () = delete;
  AdminOps (const AdminOps&) = delete;
  void operator= (const AdminOps&) = delete;

  /**
   * Destroys tokens from the given ledger holding.
   */
  OpStatus BurnTokens (const std::string& caller, const std::string& holding,
                       Amount amount);

  /**
   * Moves tokens from the caller into the reward pool.
   */
  OpStatus RefillRewardPool (const std::string& caller, Amount amount);

  /**
   * Moves liquidity from the caller's account into the liquidity holding,
   * from where it can later be locked into the vault.
   */
  OpStatus ProvideLiquidity (const std::string& caller, Amount amount);

  /**
   * Overwrites the APY and fee percentage.
   */
  OpStatus UpdateParameters (const std::string& caller, Amount apy,
                             Amount feePercent);

  /**
   * Withdraws native coins from the treasury to the caller while the
   * presale is still active.
   */
  OpStatus WithdrawFunds (const std::string& caller, Amount amount);

  /**
   * Writes the configured stage schedule into the stage table.
   */
  OpStatus InitialiseStageTable (const std::string& caller);

  /**
   * Overwrites one entry of the stage table.
   */
  OpStatus UpdatePresaleStage (const std::string& caller, unsigned index,
                               Amount price, Amount tokensSold,
                               Amount totalRaised);

};

} // namespace lpd

#endif // LPD_ADMINOPS_HPP
