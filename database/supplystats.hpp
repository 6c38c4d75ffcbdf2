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

#ifndef DATABASE_SUPPLYSTATS_HPP
#define DATABASE_SUPPLYSTATS_HPP

#include "amount.hpp"
#include "database.hpp"

#include <set>
#include <string>

namespace lpd
{

/**
 * Wrapper around the running totals kept for supply statistics, like the
 * amount of tokens burnt or the fees collected by the presale.  The values
 * are pure bookkeeping and do not influence the consensus logic except
 * for the slow state validation.
 */
class SupplyStats
{

private:

  /** The underlying database handle.  */
  Database& db;

public:

  explicit SupplyStats (Database& d)
    : db(d)
  {}

  SupplyStats () = delete;
  SupplyStats (const SupplyStats&) = delete;
  void operator= (const SupplyStats&) = delete;

  /**
   * Returns the value of one entry.  This CHECK-fails if the key is
   * invalid (as we have a well-defined and initialised set of rows
   * at all times).
   */
  Amount Get (const std::string& key);

  /**
   * Increments the amount for one entry.  Returns false (and changes
   * nothing) if the total would overflow.
   */
  bool Increment (const std::string& key, Amount value);

  /**
   * Initialises the database, putting in all valid entries with
   * zero amounts.
   */
  void InitialiseDatabase ();

  /**
   * Returns the set of valid keys.
   */
  static const std::set<std::string>& GetValidKeys ();

};

} // namespace lpd

#endif // DATABASE_SUPPLYSTATS_HPP
