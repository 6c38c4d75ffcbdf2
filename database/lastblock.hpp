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
#ifndef DATABASE_LASTBLOCK_HPP
#define DATABASE_LASTBLOCK_HPP

#include "amount.hpp"
#include "database.hpp"

namespace lpd
{

/**
 * Access to the height and timestamp of the last block that has been
 * processed.  This is what read-only queries (like the game-state JSON)
 * use as their notion of "now".
 */
class LastBlock
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  explicit LastBlock (Database& d)
    : db(d)
  {}

  LastBlock () = delete;
  LastBlock (const LastBlock&) = delete;
  void operator= (const LastBlock&) = delete;

  /**
   * Records the given block as the last one processed.
   */
  void Set (unsigned height, Timestamp timestamp);

  /**
   * Retrieves the last block.  Returns false if no block has been
   * processed yet.
   */
  bool Get (unsigned& height, Timestamp& timestamp);

};

} // namespace lpd

#endif // DATABASE_LASTBLOCK_HPP
