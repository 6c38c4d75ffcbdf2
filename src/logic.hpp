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

#ifndef LPD_LOGIC_HPP
#define LPD_LOGIC_HPP

#include "context.hpp"
#include "gamestatejson.hpp"
#include "ledger.hpp"

#include "database/database.hpp"

#include <xayagame/sqlitegame.hpp>
#include <xayagame/sqlitestorage.hpp>

#include <json/json.h>

#include <string>

namespace lpd
{

/**
 * Database instance that uses the SQLiteDatabase of an SQLiteGame.
 */
class SQLiteGameDatabase : public Database
{

public:

  explicit SQLiteGameDatabase (xaya::SQLiteDatabase& d);

  SQLiteGameDatabase () = delete;
  SQLiteGameDatabase (const SQLiteGameDatabase&) = delete;
  void operator= (const SQLiteGameDatabase&) = delete;

};

/**
 * The game logic implementation for the presale.  This is the main class
 * that acts as the game-specific code, interacting with libxayagame and the
 * Xaya daemon.  By itself, it is combining the various other classes and
 * functions that implement the real presale logic.
 */
class LaunchpadLogic : public xaya::SQLiteGame
{

private:

  /**
   * Sets up the initial state of the presale (admin, global staking state,
   * stage table and the token supply).  This is extracted here out of
   * InitialiseState so that it can be used from unit tests.
   */
  static void InitialiseState (Database& db, const Context& ctx);

  /**
   * Handles the actual logic for the game-state update.  This is extracted
   * here out of UpdateState, so that it can be accessed from unit tests
   * independently of SQLiteGame.
   */
  static void UpdateState (Database& db, xaya::Chain chain,
                           const Json::Value& blockData);

  /**
   * Updates the state with a custom Ledger.  This is used for mocking
   * the instance in tests.
   */
  static void UpdateState (Database& db, Ledger& ledger, const Context& ctx,
                           const Json::Value& blockData);

  /**
   * Constructs the game-state JSON as of the last processed block.
   */
  static Json::Value BuildStateJson (Database& db, xaya::Chain chain);

  /**
   * Performs (potentially slow) validations on the current database state.
   * This is used when compiled with ENABLE_SLOW_ASSERTS after each block
   * update, for testing purposes.  It should not be run in production builds
   * because it may really slow down syncing.  If an error is detected, then
   * this CHECK-fails the binary.
   */
  static void ValidateStateSlow (Database& db, const Context& ctx);

  friend class LaunchpadLogicTests;

protected:

  void SetupSchema (xaya::SQLiteDatabase& db) override;

  void GetInitialStateBlock (unsigned& height,
                             std::string& hashHex) const override;
  void InitialiseState (xaya::SQLiteDatabase& db) override;

  void UpdateState (xaya::SQLiteDatabase& db,
                    const Json::Value& blockData) override;

  Json::Value GetStateAsJson (const xaya::SQLiteDatabase& db) override;

public:

  LaunchpadLogic () = default;

  LaunchpadLogic (const LaunchpadLogic&) = delete;
  void operator= (const LaunchpadLogic&) = delete;

};

} // namespace lpd

#endif // LPD_LOGIC_HPP
