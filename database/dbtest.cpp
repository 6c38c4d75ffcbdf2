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

#include "dbtest.hpp"

#include "schema.hpp"
#include "supplystats.hpp"

#include <glog/logging.h>

namespace lpd
{

TestDatabase::TestDatabase ()
  : db("test", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY)
{
  SetDatabase (db);
}

DBTestWithSchema::DBTestWithSchema ()
{
  LOG (INFO) << "Setting up game-state schema in test database...";
  SetupDatabaseSchema (db.GetHandle ());

  SupplyStats stats(db);
  stats.InitialiseDatabase ();
}

namespace
{

struct CountResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, cnt, 1);
};

} // anonymous namespace

unsigned
DBTestWithSchema::CountRows (const std::string& table)
{
  auto stmt = db.Prepare ("SELECT COUNT(*) AS `cnt` FROM `" + table + "`");
  auto res = stmt.Query<CountResult> ();
  CHECK (res.Step ());
  const unsigned cnt = res.Get<CountResult::cnt> ();
  CHECK (!res.Step ());
  return cnt;
}

} // namespace lpd
