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

#include "stakes.hpp"

#include <glog/logging.h>

namespace lpd
{

StakeAccount::StakeAccount (Database& d, const std::string& n)
  : db(d), name(n), amount(0), startTime(0), lastClaimTime(0), dirty(true)
{
  VLOG (1) << "Created new stake for " << name;
}

StakeAccount::StakeAccount (Database& d,
                            const Database::Result<StakeResult>& res)
  : db(d), dirty(false)
{
  name = res.Get<StakeResult::name> ();
  amount = AmountFromColumn (res.Get<StakeResult::amount> ());
  startTime = res.Get<StakeResult::start_time> ();
  lastClaimTime = res.Get<StakeResult::last_claim_time> ();

  VLOG (2) << "Created stake instance for " << name << " from database";
}

StakeAccount::~StakeAccount ()
{
  if (!dirty)
    {
      VLOG (2) << "Stake of " << name << " is not dirty";
      return;
    }

  VLOG (1) << "Updating stake of " << name << " in the database";

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `stakes`
      (`name`, `amount`, `start_time`, `last_claim_time`)
      VALUES (?1, ?2, ?3, ?4)
  )");

  stmt.Bind (1, name);
  stmt.Bind (2, AmountToColumn (amount));
  stmt.Bind (3, startTime);
  stmt.Bind (4, lastClaimTime);

  stmt.Execute ();
}

StakesTable::Handle
StakesTable::CreateNew (const std::string& name)
{
  CHECK (GetByName (name) == nullptr)
      << "Stake for " << name << " exists already";
  return Handle (new StakeAccount (db, name));
}

StakesTable::Handle
StakesTable::GetFromResult (const Database::Result<StakeResult>& res)
{
  return Handle (new StakeAccount (db, res));
}

StakesTable::Handle
StakesTable::GetByName (const std::string& name)
{
  auto stmt = db.Prepare ("SELECT * FROM `stakes` WHERE `name` = ?1");
  stmt.Bind (1, name);
  auto res = stmt.Query<StakeResult> ();

  if (!res.Step ())
    return nullptr;

  auto r = GetFromResult (res);
  CHECK (!res.Step ());
  return r;
}

Database::Result<StakeResult>
StakesTable::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `stakes`
      ORDER BY `name`
  )");
  return stmt.Query<StakeResult> ();
}

bool
StakesTable::SumAmounts (Amount& total)
{
  total = 0;

  /* We sum up in C++ rather than SQL, since SQLite's SUM works on
     signed integers and the amounts use the full unsigned range.  */
  auto res = QueryAll ();
  while (res.Step ())
    {
      const Amount cur = AmountFromColumn (res.Get<StakeResult::amount> ());
      if (!CheckedAdd (total, cur, total))
        return false;
    }

  return true;
}

} // namespace lpd
