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

#ifndef LPD_GAMESTATEJSON_HPP
#define LPD_GAMESTATEJSON_HPP

#include "context.hpp"

#include "database/database.hpp"

#include <json/json.h>

namespace lpd
{

/**
 * Utility class that handles construction of game-state JSON.
 */
class GameStateJson
{

private:

  /** Database to read from.  */
  Database& db;

  /** Current parameter context.  */
  const Context& ctx;

  /**
   * Extracts all results from the Database::Result instance, converts them
   * to JSON, and returns a JSON array.
   */
  template <typename T, typename R>
    Json::Value ResultsAsArray (T& tbl, Database::Result<R> res) const;

public:

  explicit GameStateJson (Database& d, const Context& c)
    : db(d), ctx(c)
  {}

  GameStateJson () = delete;
  GameStateJson (const GameStateJson&) = delete;
  void operator= (const GameStateJson&) = delete;

  /**
   * Converts a state instance (like a StakeAccount) to the corresponding
   * JSON value in the game state.
   */
  template <typename T>
    Json::Value Convert (const T& val) const;

  /**
   * Returns the presale lifecycle state.  If the presale has not been
   * initialised yet, the result is null.
   */
  Json::Value Presale ();

  /**
   * Returns the global staking state, or null if it is not initialised.
   */
  Json::Value Global ();

  /**
   * Returns the JSON data of all presale stages.
   */
  Json::Value Stages ();

  /**
   * Returns the JSON data of all stake accounts.  If the context has a
   * timestamp, each entry also contains the rewards claimable at that time.
   */
  Json::Value Stakes ();

  /**
   * Returns all non-zero balances, as an object keyed by holding and
   * then currency.
   */
  Json::Value Balances ();

  /**
   * Returns the supply statistics.
   */
  Json::Value Supply ();

  /**
   * Returns the metadata of the presale token together with its current
   * total supply.
   */
  Json::Value Token ();

  /**
   * Returns the height and timestamp of the last processed block, or null
   * if there is none yet.
   */
  Json::Value Block ();

  /**
   * Returns the full game state JSON for the given Database handle.
   */
  Json::Value FullState ();

};

} // namespace lpd

#endif // LPD_GAMESTATEJSON_HPP
