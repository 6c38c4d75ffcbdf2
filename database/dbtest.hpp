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

#ifndef DATABASE_DBTEST_HPP
#define DATABASE_DBTEST_HPP

#include "database.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <gtest/gtest.h>

#include <sqlite3.h>

#include <string>

namespace lpd
{

/**
 * Database instance that uses an in-memory SQLite.  That way, we can run
 * tests independently from SQLiteGame.
 */
class TestDatabase : public Database
{

private:

  /** The SQLiteDatabase instance.  */
  xaya::SQLiteDatabase db;

public:

  TestDatabase ();

  TestDatabase (const TestDatabase&) = delete;
  void operator= (const TestDatabase&) = delete;

  /**
   * Returns the underlying database handle for SQLite.
   */
  sqlite3*
  GetHandle ()
  {
    return *db;
  }

};

/**
 * Test fixture that has a TestDatabase inside.
 */
class DBTestFixture : public testing::Test
{

protected:

  /** The database instance to use.  */
  TestDatabase db;

  DBTestFixture () = default;

};

/**
 * Test fixture that opens an in-memory database and also installs the
 * game-state schema in it.  The presale itself is not initialised yet.
 */
class DBTestWithSchema : public DBTestFixture
{

protected:

  DBTestWithSchema ();

  /**
   * Returns the number of rows in the given table.  This is useful to
   * verify that failed operations did not leave anything behind.
   */
  unsigned CountRows (const std::string& table);

};

} // namespace lpd

#endif // DATABASE_DBTEST_HPP
