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

#include "ledger.hpp"

#include <glog/logging.h>

#include <sstream>

namespace lpd
{

std::string
AccountHolding (const std::string& name)
{
  return "p/" + name;
}

namespace
{

/**
 * Constructs the error for a holding that does not have enough funds.
 */
OpStatus
InsufficientFunds (const std::string& currency, const std::string& holding,
                   const Amount balance, const Amount needed)
{
  std::ostringstream msg;
  msg << holding << " has only " << balance << " " << currency
      << ", needs " << needed;
  return OpStatus (ErrorCode::INSUFFICIENT_FUNDS, msg.str ());
}

} // anonymous namespace

Amount
DatabaseLedger::GetBalance (const std::string& currency,
                            const std::string& holding)
{
  return balances.Get (holding, currency);
}

OpStatus
DatabaseLedger::Transfer (const std::string& currency,
                          const std::string& from, const std::string& to,
                          const Amount amount)
{
  VLOG (1)
      << "Transfer of " << amount << " " << currency
      << " from " << from << " to " << to;

  const Amount fromBalance = balances.Get (from, currency);
  Amount newFrom;
  if (!CheckedSub (fromBalance, amount, newFrom))
    return InsufficientFunds (currency, from, fromBalance, amount);

  if (amount == 0 || from == to)
    return OpStatus ();

  Amount newTo;
  if (!CheckedAdd (balances.Get (to, currency), amount, newTo))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT,
                     "balance of " + to + " would overflow");

  balances.Set (from, currency, newFrom);
  balances.Set (to, currency, newTo);

  return OpStatus ();
}

OpStatus
DatabaseLedger::Burn (const std::string& currency,
                      const std::string& holding, const Amount amount)
{
  VLOG (1) << "Burning " << amount << " " << currency << " from " << holding;

  const Amount balance = balances.Get (holding, currency);
  Amount newBalance;
  if (!CheckedSub (balance, amount, newBalance))
    return InsufficientFunds (currency, holding, balance, amount);

  if (amount == 0)
    return OpStatus ();

  if (currency == token && !stats.Increment ("burnt", amount))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT, "burnt total overflows");

  balances.Set (holding, currency, newBalance);
  return OpStatus ();
}

OpStatus
DatabaseLedger::Mint (const std::string& currency,
                      const std::string& holding, const Amount amount)
{
  VLOG (1) << "Minting " << amount << " " << currency << " into " << holding;

  if (amount == 0)
    return OpStatus ();

  Amount newBalance;
  if (!CheckedAdd (balances.Get (holding, currency), amount, newBalance))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT,
                     "balance of " + holding + " would overflow");

  if (currency == token && !stats.Increment ("minted", amount))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT, "minted total overflows");

  balances.Set (holding, currency, newBalance);
  return OpStatus ();
}

} // namespace lpd
