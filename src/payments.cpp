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

#include "payments.hpp"

#include "database/supplystats.hpp"

#include <glog/logging.h>

#include <sstream>

namespace lpd
{

OpStatus
PaymentProcessor::AcceptPayment (const std::string& caller,
                                 const Amount amount,
                                 const std::string& currency,
                                 const PaymentRoute& route)
{
  const auto& cfg = ctx.RoConfig ();
  const auto& holdings = cfg->holdings ();

  if (!route.treasury.empty () && route.treasury != holdings.treasury ())
    return OpStatus (ErrorCode::INVALID_FEE_RECIPIENT,
                     "invalid treasury: " + route.treasury);
  if (!route.feeRecipient.empty ()
        && route.feeRecipient != holdings.fee_recipient ())
    return OpStatus (ErrorCode::INVALID_FEE_RECIPIENT,
                     "invalid fee recipient: " + route.feeRecipient);

  if (!cfg.IsPaymentCurrency (currency))
    return OpStatus (ErrorCode::INVALID_TOKEN_MINT,
                     "invalid payment currency: " + currency);

  const Amount fee = ctx.Params ().FlatFee ();
  if (amount <= fee)
    {
      std::ostringstream msg;
      msg << "payment of " << amount << " does not exceed the fee " << fee;
      return OpStatus (ErrorCode::INVALID_AMOUNT, msg.str ());
    }
  const Amount net = amount - fee;

  const std::string payer = AccountHolding (caller);

  /* Checking the full amount up front ensures that the fee transfer
     can not fail after the treasury has been paid.  */
  const Amount balance = ledger.GetBalance (currency, payer);
  if (balance < amount)
    {
      std::ostringstream msg;
      msg << caller << " has only " << balance << " " << currency;
      return OpStatus (ErrorCode::INSUFFICIENT_FUNDS, msg.str ());
    }

  VLOG (1)
      << "Payment of " << amount << " " << currency << " from " << caller
      << ": " << net << " to treasury, " << fee << " fee";

  OpStatus res = ledger.Transfer (currency, payer, holdings.treasury (), net);
  if (!res.IsOk ())
    return res;
  res = ledger.Transfer (currency, payer, holdings.fee_recipient (), fee);
  if (!res.IsOk ())
    return res;

  /* Only fees in the presale token count towards the supply statistics,
     as amounts in different currencies can not be summed up.  */
  SupplyStats stats(db);
  if (fee > 0 && currency == cfg->currencies ().token ()
        && !stats.Increment ("fees", fee))
    return OpStatus (ErrorCode::ARITHMETIC_FAULT, "fee total overflows");

  return OpStatus ();
}

OpStatus
PaymentProcessor::DepositNative (const std::string& caller,
                                 const Amount amount)
{
  const auto& cfg = ctx.RoConfig ();

  VLOG (1) << "Deposit of " << amount << " native coins from " << caller;
  return ledger.Transfer (cfg->currencies ().native (),
                          AccountHolding (caller),
                          cfg->holdings ().treasury (), amount);
}

OpStatus
PaymentProcessor::CreditFromChain (const std::string& caller,
                                   const Amount amount)
{
  const auto& cfg = ctx.RoConfig ();

  VLOG (1) << "Crediting " << amount << " native coins to " << caller;
  return ledger.Mint (cfg->currencies ().native (),
                      AccountHolding (caller), amount);
}

} // namespace lpd
