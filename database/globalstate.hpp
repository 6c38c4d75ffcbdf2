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

#ifndef DATABASE_GLOBALSTATE_HPP
#define DATABASE_GLOBALSTATE_HPP

#include "amount.hpp"
#include "database.hpp"

#include <memory>

namespace lpd
{

/**
 * Database result type for the global staking aggregates.
 */
struct GlobalStateResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, total_staked, 1);
  RESULT_COLUMN (int64_t, reward_pool, 2);
  RESULT_COLUMN (int64_t, apy, 3);
  RESULT_COLUMN (int64_t, fee_percent, 4);
};

/**
 * Handle for the global aggregates of the staking system.  Changes are
 * written back to the database when the handle is destructed.
 *
 * The setters just store the values.  Callers are responsible for doing
 * the arithmetic with the checked helpers.
 */
class GlobalState
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  Amount totalStaked;
  Amount rewardPool;
  Amount apy;
  Amount feePercent;

  /** Whether or not the data has been modified.  */
  bool dirty;

  /**
   * Constructs a fresh instance with zero aggregates.
   */
  explicit GlobalState (Database& d, Amount a, Amount f);

  /**
   * Constructs the instance from a database row.
   */
  explicit GlobalState (Database& d,
                        const Database::Result<GlobalStateResult>& res);

  friend class GlobalStateTable;

public:

  ~GlobalState ();

  GlobalState () = delete;
  GlobalState (const GlobalState&) = delete;
  void operator= (const GlobalState&) = delete;

  Amount
  GetTotalStaked () const
  {
    return totalStaked;
  }

  void
  SetTotalStaked (const Amount val)
  {
    totalStaked = val;
    dirty = true;
  }

  Amount
  GetRewardPool () const
  {
    return rewardPool;
  }

  void
  SetRewardPool (const Amount val)
  {
    rewardPool = val;
    dirty = true;
  }

  Amount
  GetApy () const
  {
    return apy;
  }

  Amount
  GetFeePercent () const
  {
    return feePercent;
  }

  /**
   * Overwrites the governance parameters.
   */
  void SetParameters (Amount newApy, Amount newFeePercent);

};

/**
 * Access to the global-state singleton in the database.
 */
class GlobalStateTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to the global state.  */
  using Handle = std::unique_ptr<GlobalState>;

  explicit GlobalStateTable (Database& d)
    : db(d)
  {}

  GlobalStateTable () = delete;
  GlobalStateTable (const GlobalStateTable&) = delete;
  void operator= (const GlobalStateTable&) = delete;

  /**
   * Returns true if the global state has been initialised.
   */
  bool IsInitialised ();

  /**
   * Creates the global state with zero aggregates and the given rates.
   * Must not be called if it exists already.
   */
  Handle Initialise (Amount apy, Amount feePercent);

  /**
   * Returns a handle to the global state, or null if it has not been
   * initialised yet.
   */
  Handle Get ();

};

} // namespace lpd

#endif // DATABASE_GLOBALSTATE_HPP
