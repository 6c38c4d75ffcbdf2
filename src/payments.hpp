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

#ifndef LPD_PAYMENTS_HPP
#define LPD_PAYMENTS_HPP

#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"

#include <string>

namespace lpd
{

/**
 * The holdings a payer intends a payment to go to.  Empty entries mean
 * the configured holdings.  Non-empty ones must match them.
 */
struct PaymentRoute
{
  std::string treasury;
  std::string feeRecipient;
};

/**
 * Processes payments into the presale.  Every payment in one of the
 * accepted currencies is split into a flat fee for the fee recipient and
 * the rest for the treasury.
 */
class PaymentProcessor
{

private:

  Database& db;
  Ledger& ledger;
  const Context& ctx;

public:

  explicit PaymentProcessor (Database& d, Ledger& l, const Context& c)
    : db(d), ledger(l), ctx(c)
  {}

  PaymentProcessor () = delete;
  PaymentProcessor (const PaymentProcessor&) = delete;
  void operator= (const PaymentProcessor&) = delete;

  /**
   * Accepts a payment of the given amount and currency from the caller.
   */
  OpStatus AcceptPayment (const std::string& caller, Amount amount,
                          const std::string& currency,
                          const PaymentRoute& route);

  /**
   * Transfers native currency from the caller to the treasury without
   * taking any fee.
   */
  OpStatus DepositNative (const std::string& caller, Amount amount);

  /**
   * Credits native coins that the caller sent to the presale address
   * on chain to their holding.
   */
  OpStatus CreditFromChain (const std::string& caller, Amount amount);

};

} // namespace lpd

#endif // LPD_PAYMENTS_HPP
