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

#include "params.hpp"

#include <glog/logging.h>

namespace lpd
{

Params::Params (const proto::Params& pb)
{
  flatFee = pb.flat_fee ();
  stakingDuration = pb.staking_duration_days () * SECONDS_PER_DAY;
  earlyUnstakeLock = pb.early_unstake_lock_days () * SECONDS_PER_DAY;
  liquidityLockDuration = pb.liquidity_lock_days () * SECONDS_PER_DAY;
  penaltyPercent = pb.early_unstake_penalty_percent ();
  stakeClock = pb.stake_clock ();
  godMode = pb.god_mode ();

  adminPrincipals.insert (pb.admin_principals ().begin (),
                          pb.admin_principals ().end ());

  CHECK_GT (stakingDuration, 0) << "Invalid staking duration";
  CHECK_LE (penaltyPercent, 100) << "Invalid penalty percentage";
  CHECK (adminPrincipals.empty () || adminPrincipals.count (pb.admin ()) > 0)
      << "Admin principals must include the admin " << pb.admin ();
}

} // namespace lpd
