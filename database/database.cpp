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

#include "database.hpp"

#include <glog/logging.h>

namespace lpd
{

void
Database::SetDatabase (xaya::SQLiteDatabase& d)
{
  CHECK (db == nullptr) << "Database has already been set";
  db = &d;
}

Database::Statement
Database::Prepare (const std::string& sql)
{
  CHECK (db != nullptr) << "Database has not been set";
  return Statement (*this, db->Prepare (sql));
}

void
Database::Statement::Reset ()
{
  CHECK (!queried) << "SELECT statements can't be reset";
  sqlite3_clear_bindings (*stmt);
  stmt.Reset ();
  executed = false;
}

void
Database::Statement::Execute ()
{
  CHECK (!executed && !queried) << "Database statement has already been run";
  executed = true;
  stmt.Execute ();
}

template <>
  void
  Database::Statement::Bind<int32_t> (const unsigned ind, const int32_t& val)
{
  Bind<int64_t> (ind, val);
}

template <>
  void
  Database::Statement::Bind<uint32_t> (const unsigned ind, const uint32_t& val)
{
  Bind<int64_t> (ind, val);
}

Database::Savepoint::Savepoint (Database& d, const std::string& n)
  : db(d), name(n)
{
  VLOG (2) << "Opening savepoint " << name;
  auto stmt = db.Prepare ("SAVEPOINT `" + name + "`");
  stmt.Execute ();
}

Database::Savepoint::~Savepoint ()
{
  if (released)
    return;

  VLOG (1) << "Rolling back savepoint " << name;

  /* ROLLBACK TO leaves the savepoint on the stack, so we have to release
     it explicitly afterwards.  */
  auto rollback = db.Prepare ("ROLLBACK TO `" + name + "`");
  rollback.Execute ();
  auto release = db.Prepare ("RELEASE `" + name + "`");
  release.Execute ();
}

void
Database::Savepoint::Commit ()
{
  CHECK (!released) << "Savepoint " << name << " has already been released";
  VLOG (2) << "Releasing savepoint " << name;

  auto stmt = db.Prepare ("RELEASE `" + name + "`");
  stmt.Execute ();
  released = true;
}

} // namespace lpd
