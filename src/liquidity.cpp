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

#include "liquidity.hpp"

#include "database/presale.hpp"

#include <glog/logging.h>

namespace lpd
{

OpStatus
LiquidityLock::Lock (const std::string& caller)
{
  PresaleTable presaleTbl(db);
  auto presale = presaleTbl.Get ();
  if (presale == nullptr || !presale->HasLiquidityLockEnd ()
        || ctx.Timestamp () >= presale->GetLiquidityLockEnd ())
    return OpStatus (ErrorCode::LIQUIDITY_LOCK_ERROR,
                     "liquidity can not be locked now");

  const auto& cfg = ctx.RoConfig ();
  const std::string& currency = cfg->currencies ().liquidity ();
  const std::string& source = cfg->holdings ().liquidity ();

  const Amount amount = ledger.GetBalance (currency, source);
  if (amount == 0)
    return OpStatus (ErrorCode::INVALID_AMOUNT, "there is no liquidity");

  const OpStatus res
      = ledger.Transfer (currency, source, cfg->holdings ().vault (), amount);
  if (!res.IsOk ())
    return res;

  LOG (INFO) << caller << " locked " << amount << " liquidity into the vault";
  presale->SetLiquidityLocked ();

  return OpStatus ();
}

} // namespace lpd
