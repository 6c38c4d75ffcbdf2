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
#include "transfers.hpp"

#include <glog/logging.h>

namespace lpd
{

OpStatus
TokenTransfers::Transfer (const std::string& caller,
                          const std::string& recipient, const Amount amount)
{
  if (recipient.empty ())
    return OpStatus (ErrorCode::INVALID_RECIPIENT, "empty recipient");
  if (amount == 0)
    return OpStatus (ErrorCode::INVALID_AMOUNT, "cannot transfer zero");

  const std::string& token = ctx.RoConfig ()->currencies ().token ();
  const OpStatus res = ledger.Transfer (token, AccountHolding (caller),
                                        AccountHolding (recipient), amount);
  if (!res.IsOk ())
    return res;

  LOG (INFO)
      << caller << " sends " << amount << " tokens to " << recipient;

  return OpStatus ();
}

OpStatus
TokenTransfers::Burn (const std::string& caller, const Amount amount)
{
  if (amount == 0)
    return OpStatus (ErrorCode::INVALID_AMOUNT, "cannot burn zero");

  const std::string& token = ctx.RoConfig ()->currencies ().token ();
  const OpStatus res = ledger.Burn (token, AccountHolding (caller), amount);
  if (!res.IsOk ())
    return res;

  LOG (INFO) << caller << " burns " << amount << " of their tokens";

  return OpStatus ();
}

} // namespace lpd
