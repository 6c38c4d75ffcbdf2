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

#ifndef LPD_OPERATIONS_HPP
#define LPD_OPERATIONS_HPP

#include "authorisation.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "payments.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"

#include <memory>
#include <string>

namespace lpd
{

/**
 * The public operations of the presale economy.  Each operation is
 * executed atomically:  It runs inside a database savepoint that is only
 * released if the operation succeeds, so that a failed operation (even
 * one that fails in a late ledger step) has no effect at all.
 *
 * All operations take the authenticated name of the caller.
 */
class Operations
{

private:

  Database& db;
  Ledger& ledger;
  const Context& ctx;

  /** The authorisation policy for admin operations.  */
  std::unique_ptr<AuthorisationPolicy> auth;

  /**
   * Runs the given function (returning an OpStatus) inside a savepoint,
   * and rolls back all its changes unless it succeeds.
   */
  template <typename Fcn>
    OpStatus RunAtomically (const std::string& op, const Fcn& fcn);

public:

  explicit Operations (Database& d, Ledger& l, const Context& c);

  Operations () = delete;
  Operations (const Operations&) = delete;
  void operator= (const Operations&) = delete;

  /* Lifecycle and setup.  */
  OpStatus InitialisePresale (const std::string& caller);
  OpStatus InitialiseGlobalState (const std::string& caller, Amount apy,
                                  Amount feePercent);
  OpStatus InitialiseStageTable (const std::string& caller);
  OpStatus EndPresale (const std::string& caller);

  /* Payments.  */
  OpStatus AcceptPayment (const std::string& caller, Amount amount,
                          const std::string& currency,
                          const PaymentRoute& route);
  OpStatus DepositNative (const std::string& caller, Amount amount);

  /* Staking.  */
  OpStatus Stake (const std::string& caller, Amount amount);
  OpStatus Unstake (const std::string& caller);
  OpStatus ClaimRewards (const std::string& caller);

  /**
   * Computes the caller's claimable rewards.  This never changes
   * the state.
   */
  OpStatus CalculateRewards (const std::string& caller, Amount& reward);

  OpStatus LockLiquidity (const std::string& caller);

  /* Token transfers between players.  */
  OpStatus TransferTokens (const std::string& caller,
                           const std::string& recipient, Amount amount);
  OpStatus BurnOwnTokens (const std::string& caller, Amount amount);

  /* Admin operations.  */
  OpStatus BurnTokens (const std::string& caller, const std::string& holding,
                       Amount amount);
  OpStatus RefillRewardPool (const std::string& caller, Amount amount);
  OpStatus ProvideLiquidity (const std::string& caller, Amount amount);
  OpStatus UpdateParameters (const std::string& caller, Amount apy,
                             Amount feePercent);
  OpStatus WithdrawFunds (const std::string& caller, Amount amount);
  OpStatus UpdatePresaleStage (const std::string& caller, unsigned index,
                               Amount price, Amount tokensSold,
                               Amount totalRaised);

  /**
   * Credits native coins sent on chain to the presale address.
   */
  OpStatus CreditFromChain (const std::string& caller, Amount amount);

  /**
   * Mints currency into a holding.  This is only used by god mode
   * for testing.
   */
  OpStatus GodMint (const std::string& currency, const std::string& holding,
                    Amount amount);

};

} // namespace lpd

#endif // LPD_OPERATIONS_HPP
