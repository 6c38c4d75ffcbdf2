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

#ifndef DATABASE_STAKES_HPP
#define DATABASE_STAKES_HPP

#include "amount.hpp"
#include "database.hpp"

#include <memory>
#include <string>

namespace lpd
{

/**
 * Database result type for rows from the stakes table.
 */
struct StakeResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, name, 1);
  RESULT_COLUMN (int64_t, amount, 2);
  RESULT_COLUMN (int64_t, start_time, 3);
  RESULT_COLUMN (int64_t, last_claim_time, 4);
};

/**
 * Wrapper class around the stake of one depositor.  Instances should be
 * obtained through the StakesTable.
 */
class StakeAccount
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The Xaya name of the depositor.  */
  std::string name;

  Amount amount;
  Timestamp startTime;
  Timestamp lastClaimTime;

  /** Whether or not the data has been modified.  */
  bool dirty;

  /**
   * Constructs a zero-initialised stake for the given name.
   */
  explicit StakeAccount (Database& d, const std::string& n);

  /**
   * Constructs an instance based on the given DB result set.
   */
  explicit StakeAccount (Database& d, const Database::Result<StakeResult>& res);

  friend class StakesTable;

public:

  /**
   * In the destructor, the underlying database is updated if there are any
   * modifications to send.
   */
  ~StakeAccount ();

  StakeAccount () = delete;
  StakeAccount (const StakeAccount&) = delete;
  void operator= (const StakeAccount&) = delete;

  const std::string&
  GetName () const
  {
    return name;
  }

  Amount
  GetAmount () const
  {
    return amount;
  }

  void
  SetAmount (const Amount val)
  {
    amount = val;
    dirty = true;
  }

  Timestamp
  GetStartTime () const
  {
    return startTime;
  }

  void
  SetStartTime (const Timestamp val)
  {
    startTime = val;
    dirty = true;
  }

  Timestamp
  GetLastClaimTime () const
  {
    return lastClaimTime;
  }

  void
  SetLastClaimTime (const Timestamp val)
  {
    lastClaimTime = val;
    dirty = true;
  }

};

/**
 * Utility class that handles querying the stakes table in the database and
 * should be used to obtain StakeAccount instances.
 */
class StakesTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to a stake instance.  */
  using Handle = std::unique_ptr<StakeAccount>;

  explicit StakesTable (Database& d)
    : db(d)
  {}

  StakesTable () = delete;
  StakesTable (const StakesTable&) = delete;
  void operator= (const StakesTable&) = delete;

  /**
   * Creates a new, zero-initialised stake for the given name.  Calling this
   * for a name that already has a stake is an error.
   */
  Handle CreateNew (const std::string& name);

  /**
   * Returns a handle for the instance based on a Database::Result.
   */
  Handle GetFromResult (const Database::Result<StakeResult>& res);

  /**
   * Returns the stake with the given name, or null if there is none.
   */
  Handle GetByName (const std::string& name);

  /**
   * Queries the database for all stakes, ordered by name.
   */
  Database::Result<StakeResult> QueryAll ();

  /**
   * Computes the sum of all staked amounts.  Returns false if the sum
   * overflows (which means the database is corrupt).
   */
  bool SumAmounts (Amount& total);

};

} // namespace lpd

#endif // DATABASE_STAKES_HPP
