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

#ifndef DATABASE_STAGES_HPP
#define DATABASE_STAGES_HPP

#include "amount.hpp"
#include "database.hpp"

#include <vector>

namespace lpd
{

/**
 * Data of one presale stage.
 */
struct PresaleStage
{

  /** Zero-based index in the table.  */
  unsigned index;

  /** One-based stage number (index + 1).  */
  unsigned stage;

  /** Price per token as fixed-point number with 8 decimals.  */
  Amount price;

  Amount tokensSold;
  Amount totalRaised;

};

/**
 * The fixed table of presale stages.  The table has exactly NUM_STAGES
 * entries once initialised, and all accesses are bounds-checked here,
 * so that callers can pass through untrusted indices from moves.
 */
class PresaleStageTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Number of entries in the table.  */
  static constexpr unsigned NUM_STAGES = 8;

  explicit PresaleStageTable (Database& d)
    : db(d)
  {}

  PresaleStageTable () = delete;
  PresaleStageTable (const PresaleStageTable&) = delete;
  void operator= (const PresaleStageTable&) = delete;

  /**
   * Returns true if the table has been initialised.
   */
  bool IsInitialised ();

  /**
   * Writes the initial schedule.  The data must have exactly NUM_STAGES
   * entries; their index and stage fields are ignored and set from the
   * position.  Must only be called once.
   */
  void Initialise (const std::vector<PresaleStage>& schedule);

  /**
   * Looks up the stage with the given index.  Returns false if the index
   * is out of range or the table is not initialised.
   */
  bool Get (unsigned index, PresaleStage& out);

  /**
   * Overwrites the entry with the given index.  Returns false (and changes
   * nothing) if the index is out of range or the table is not initialised.
   */
  bool Update (unsigned index, Amount price, Amount tokensSold,
               Amount totalRaised);

  /**
   * Returns all stages in order of their index.
   */
  std::vector<PresaleStage> GetAll ();

};

} // namespace lpd

#endif // DATABASE_STAGES_HPP
