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

#ifndef LPD_MOVEPROCESSOR_HPP
#define LPD_MOVEPROCESSOR_HPP

#include "context.hpp"
#include "ledger.hpp"
#include "operations.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"

#include <json/json.h>

#include <string>

namespace lpd
{

/**
 * Class that handles processing of all moves made in a block, translating
 * them into the presale operations.  Each part of a move is an independent
 * operation; if one fails, it is logged and the others still run.
 */
class MoveProcessor
{

private:

  const Context& ctx;

  /** The facade through which all operations are executed.  */
  Operations ops;

  /**
   * Extracts the basic information from a move JSON object.  This
   * returns false if the move is invalid and should not be processed
   * any further (but in a way that is not a consensus error).  Data
   * from libxayagame that does not look as expected is a CHECK failure.
   *
   * paidToPresale is set to the CHI amount (in Satoshi) the move sent
   * to the configured presale address.
   */
  bool ExtractMoveBasics (const Json::Value& moveObj,
                          std::string& name, Json::Value& mv,
                          Amount& paidToPresale) const;

  /**
   * Processes a single move.
   */
  void ProcessOne (const Json::Value& moveObj);

  void TryPayment (const std::string& name, const Json::Value& cmd);
  void TryDeposit (const std::string& name, const Json::Value& cmd);
  void TryStake (const std::string& name, const Json::Value& cmd);
  void TryClaim (const std::string& name, const Json::Value& cmd);
  void TryUnstake (const std::string& name, const Json::Value& cmd);
  void TryLiquidityLock (const std::string& name, const Json::Value& cmd);

  /**
   * Handles token transfers to other accounts and burns of the sender's
   * own tokens (the "vc" key).
   */
  void TryCoinOperation (const std::string& name, const Json::Value& cmd);

  /**
   * Handles the admin operations of a move (the "adm" key).  Whether or
   * not the sender is actually allowed to do them is checked by the
   * operations themselves.
   */
  void TryAdminOperations (const std::string& name, const Json::Value& cmd);

  /**
   * Processes a single admin command (from the Xaya game admin channel).
   */
  void ProcessOneAdmin (const Json::Value& cmd);

  /**
   * Handles god-mode commands, if god mode is enabled.
   */
  void HandleGodMode (const Json::Value& cmd);

public:

  explicit MoveProcessor (Database& d, Ledger& l, const Context& c)
    : ctx(c), ops(d, l, ctx)
  {}

  MoveProcessor () = delete;
  MoveProcessor (const MoveProcessor&) = delete;
  void operator= (const MoveProcessor&) = delete;

  /**
   * Processes all moves from the given JSON array.
   */
  void ProcessAll (const Json::Value& moveArray);

  /**
   * Processes all admin commands sent in a block.
   */
  void ProcessAdmin (const Json::Value& admArray);

};

} // namespace lpd

#endif // LPD_MOVEPROCESSOR_HPP
