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

#include <glog/logging.h>

namespace lpd
{

PresaleState::PresaleState (Database& d, const std::string& a)
  : db(d), active(true), admin(a), liquidityLocked(false), dirty(true)
{
  VLOG (1) << "Initialising presale with admin " << admin;
}

PresaleState::PresaleState (Database& d,
                            const Database::Result<PresaleResult>& res)
  : db(d), dirty(false)
{
  active = res.Get<PresaleResult::active> ();
  admin = res.Get<PresaleResult::admin> ();
  liquidityLocked = res.Get<PresaleResult::liquidity_locked> ();

  hasEndTime = !res.IsNull<PresaleResult::end_time> ();
  if (hasEndTime)
    endTime = res.Get<PresaleResult::end_time> ();

  hasLaunchTime = !res.IsNull<PresaleResult::launch_time> ();
  if (hasLaunchTime)
    launchTime = res.Get<PresaleResult::launch_time> ();

  hasLiquidityLockEnd = !res.IsNull<PresaleResult::liquidity_lock_end> ();
  if (hasLiquidityLockEnd)
    liquidityLockEnd = res.Get<PresaleResult::liquidity_lock_end> ();
}

PresaleState::~PresaleState ()
{
  if (!dirty)
    return;

  VLOG (1) << "Updating presale state in the database";
  CHECK (active || (hasEndTime && hasLaunchTime && hasLiquidityLockEnd))
      << "Ended presale is missing its timestamps";

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `presale`
      (`id`, `active`, `end_time`, `launch_time`, `admin`,
       `liquidity_locked`, `liquidity_lock_end`)
      VALUES (1, ?1, ?2, ?3, ?4, ?5, ?6)
  )");

  stmt.Bind (1, active);
  if (hasEndTime)
    stmt.Bind (2, endTime);
  else
    stmt.BindNull (2);
  if (hasLaunchTime)
    stmt.Bind (3, launchTime);
  else
    stmt.BindNull (3);
  stmt.Bind (4, admin);
  stmt.Bind (5, liquidityLocked);
  if (hasLiquidityLockEnd)
    stmt.Bind (6, liquidityLockEnd);
  else
    stmt.BindNull (6);

  stmt.Execute ();
}

Timestamp
PresaleState::GetEndTime () const
{
  CHECK (hasEndTime) << "Presale has no end time";
  return endTime;
}

Timestamp
PresaleState::GetLaunchTime () const
{
  CHECK (hasLaunchTime) << "Presale has no launch time";
  return launchTime;
}

Timestamp
PresaleState::GetLiquidityLockEnd () const
{
  CHECK (hasLiquidityLockEnd) << "Presale has no liquidity lock deadline";
  return liquidityLockEnd;
}

void
PresaleState::End (const Timestamp now, const Timestamp lockDuration)
{
  CHECK (active) << "Presale has already been ended";
  CHECK_GE (lockDuration, 0);

  active = false;
  hasEndTime = true;
  endTime = now;
  hasLaunchTime = true;
  launchTime = now;
  hasLiquidityLockEnd = true;
  liquidityLockEnd = now + lockDuration;

  dirty = true;
}

void
PresaleState::SetLiquidityLocked ()
{
  liquidityLocked = true;
  dirty = true;
}

bool
PresaleTable::IsInitialised ()
{
  return Get () != nullptr;
}

PresaleTable::Handle
PresaleTable::Initialise (const std::string& admin)
{
  CHECK (!IsInitialised ()) << "Presale has already been initialised";
  return Handle (new PresaleState (db, admin));
}

PresaleTable::Handle
PresaleTable::Get ()
{
  auto stmt = db.Prepare ("SELECT * FROM `presale` WHERE `id` = 1");
  auto res = stmt.Query<PresaleResult> ();

  if (!res.Step ())
    return nullptr;

  auto r = Handle (new PresaleState (db, res));
  CHECK (!res.Step ());
  return r;
}

} // namespace lpd
