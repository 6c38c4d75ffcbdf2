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

#include "globalstate.hpp"

#include <glog/logging.h>

namespace lpd
{

GlobalState::GlobalState (Database& d, const Amount a, const Amount f)
  : db(d), totalStaked(0), rewardPool(0), apy(a), feePercent(f), dirty(true)
{
  VLOG (1)
      << "Initialising global state with APY " << apy
      << " and fee percent " << feePercent;
}

GlobalState::GlobalState (Database& d,
                          const Database::Result<GlobalStateResult>& res)
  : db(d), dirty(false)
{
  totalStaked = AmountFromColumn (res.Get<GlobalStateResult::total_staked> ());
  rewardPool = AmountFromColumn (res.Get<GlobalStateResult::reward_pool> ());
  apy = AmountFromColumn (res.Get<GlobalStateResult::apy> ());
  feePercent = AmountFromColumn (res.Get<GlobalStateResult::fee_percent> ());
}

GlobalState::~GlobalState ()
{
  if (!dirty)
    return;

  VLOG (1)
      << "Updating global state: total staked " << totalStaked
      << ", reward pool " << rewardPool;

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `global_state`
      (`id`, `total_staked`, `reward_pool`, `apy`, `fee_percent`)
      VALUES (1, ?1, ?2, ?3, ?4)
  )");

  stmt.Bind (1, AmountToColumn (totalStaked));
  stmt.Bind (2, AmountToColumn (rewardPool));
  stmt.Bind (3, AmountToColumn (apy));
  stmt.Bind (4, AmountToColumn (feePercent));

  stmt.Execute ();
}

void
GlobalState::SetParameters (const Amount newApy, const Amount newFeePercent)
{
  apy = newApy;
  feePercent = newFeePercent;
  dirty = true;
}

bool
GlobalStateTable::IsInitialised ()
{
  return Get () != nullptr;
}

GlobalStateTable::Handle
GlobalStateTable::Initialise (const Amount apy, const Amount feePercent)
{
  CHECK (!IsInitialised ()) << "Global state has already been initialised";
  return Handle (new GlobalState (db, apy, feePercent));
}

GlobalStateTable::Handle
GlobalStateTable::Get ()
{
  auto stmt = db.Prepare ("SELECT * FROM `global_state` WHERE `id` = 1");
  auto res = stmt.Query<GlobalStateResult> ();

  if (!res.Step ())
    return nullptr;

  auto r = Handle (new GlobalState (db, res));
  CHECK (!res.Step ());
  return r;
}

} // namespace lpd
