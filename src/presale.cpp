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

#include "presale.hpp"

#include "database/presale.hpp"

#include <glog/logging.h>

#include <limits>

namespace lpd
{

OpStatus
PresaleController::Initialise (const std::string& admin)
{
  PresaleTable tbl(db);
  if (tbl.IsInitialised ())
    return OpStatus (ErrorCode::ALREADY_INITIALISED,
                     "presale has already been initialised");

  LOG (INFO) << "Initialising presale with admin " << admin;
  tbl.Initialise (admin);

  return OpStatus ();
}

OpStatus
PresaleController::End (const std::string& caller)
{
  if (!auth.IsAuthorised (caller))
    return OpStatus (ErrorCode::UNAUTHORIZED,
                     caller + " is not allowed to end the presale");

  PresaleTable tbl(db);
  auto presale = tbl.Get ();
  if (presale == nullptr)
    return OpStatus (ErrorCode::NOT_INITIALISED,
                     "presale has not been initialised");
  if (!presale->IsActive ())
    return OpStatus (ErrorCode::ALREADY_ENDED,
                     "presale has already been ended");

  const auto now = ctx.Timestamp ();
  const auto lockDuration = ctx.Params ().LiquidityLockDuration ();
  if (now > std::numeric_limits<Timestamp>::max () - lockDuration)
    return OpStatus (ErrorCode::ARITHMETIC_FAULT,
                     "liquidity lock deadline overflows");

  LOG (INFO) << "Ending presale at time " << now;
  presale->End (now, lockDuration);

  return OpStatus ();
}

} // namespace lpd
