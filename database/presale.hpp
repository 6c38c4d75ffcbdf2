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

#ifndef DATABASE_PRESALE_HPP
#define DATABASE_PRESALE_HPP

#include "amount.hpp"
#include "database.hpp"

#include <memory>
#include <string>

namespace lpd
{

/**
 * Database result type for the presale row.
 */
struct PresaleResult : public Database::ResultType
{
  RESULT_COLUMN (bool, active, 1);
  RESULT_COLUMN (int64_t, end_time, 2);
  RESULT_COLUMN (int64_t, launch_time, 3);
  RESULT_COLUMN (std::string, admin, 4);
  RESULT_COLUMN (bool, liquidity_locked, 5);
  RESULT_COLUMN (int64_t, liquidity_lock_end, 6);
};

/**
 * Handle for the singleton lifecycle state of the presale.  Modifications
 * are written back to the database when the handle is destructed.
 * Instances are obtained through PresaleTable.
 */
class PresaleState
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  bool active;

  bool hasEndTime = false;
  Timestamp endTime = 0;

  bool hasLaunchTime = false;
  Timestamp launchTime = 0;

  std::string admin;

  bool liquidityLocked;

  bool hasLiquidityLockEnd = false;
  Timestamp liquidityLockEnd = 0;

  /** Whether or not the data has been modified.  */
  bool dirty;

  /**
   * Constructs the state for a freshly initialised presale.
   */
  explicit PresaleState (Database& d, const std::string& a);

  /**
   * Constructs the instance from a database row.
   */
  explicit PresaleState (Database& d,
                         const Database::Result<PresaleResult>& res);

  friend class PresaleTable;

public:

  ~PresaleState ();

  PresaleState () = delete;
  PresaleState (const PresaleState&) = delete;
  void operator= (const PresaleState&) = delete;

  bool
  IsActive () const
  {
    return active;
  }

  const std::string&
  GetAdmin () const
  {
    return admin;
  }

  bool
  HasEndTime () const
  {
    return hasEndTime;
  }

  Timestamp GetEndTime () const;

  bool
  HasLaunchTime () const
  {
    return hasLaunchTime;
  }

  Timestamp GetLaunchTime () const;

  bool
  IsLiquidityLocked () const
  {
    return liquidityLocked;
  }

  bool
  HasLiquidityLockEnd () const
  {
    return hasLiquidityLockEnd;
  }

  Timestamp GetLiquidityLockEnd () const;

  /**
   * Ends the presale at the given time.  This sets the end and launch
   * times to now and the liquidity lock deadline to now plus the given
   * duration in seconds.  The presale must be active.
   */
  void End (Timestamp now, Timestamp lockDuration);

  /**
   * Marks the liquidity as locked.
   */
  void SetLiquidityLocked ();

};

/**
 * Access to the presale singleton in the database.
 */
class PresaleTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to the presale state.  */
  using Handle = std::unique_ptr<PresaleState>;

  explicit PresaleTable (Database& d)
    : db(d)
  {}

  PresaleTable () = delete;
  PresaleTable (const PresaleTable&) = delete;
  void operator= (const PresaleTable&) = delete;

  /**
   * Returns true if the presale has been initialised already.
   */
  bool IsInitialised ();

  /**
   * Initialises the presale with the given admin.  Must not be called
   * if the presale is already initialised.
   */
  Handle Initialise (const std::string& admin);

  /**
   * Returns a handle to the presale state.  Returns null if it has not
   * yet been initialised.
   */
  Handle Get ();

};

} // namespace lpd

#endif // DATABASE_PRESALE_HPP
