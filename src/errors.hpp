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

#ifndef LPD_ERRORS_HPP
#define LPD_ERRORS_HPP

#include <ostream>
#include <string>

namespace lpd
{

/**
 * Broad classes of failures of an operation.
 */
enum class ErrorCategory
{
  NONE,

  /* Wrong lifecycle phase or time window.  */
  PRECONDITION_VIOLATION,

  /* Checked arithmetic over- or underflowed.  */
  ARITHMETIC_FAULT,

  /* Not enough funds for a payment, stake or reward.  */
  INSUFFICIENT_BALANCE,

  /* The caller is not allowed to perform the operation.  */
  UNAUTHORIZED,

  /* Unknown currency, holding or stage index.  */
  INVALID_REFERENCE,

  /* The reward pool is empty.  */
  RESOURCE_EXHAUSTED,
};

/**
 * Specific error codes returned by operations.
 */
enum class ErrorCode
{
  OK,

  ALREADY_INITIALISED,
  NOT_INITIALISED,
  ALREADY_ENDED,
  STAKING_CLOSED,
  INVALID_AMOUNT,
  EARLY_UNSTAKE_LOCKED,
  NO_REWARDS_AVAILABLE,
  LIQUIDITY_LOCK_ERROR,
  WITHDRAWAL_NOT_ALLOWED,

  ARITHMETIC_FAULT,

  INSUFFICIENT_FUNDS,
  INSUFFICIENT_REWARDS,

  UNAUTHORIZED,

  INVALID_FEE_RECIPIENT,
  INVALID_TOKEN_MINT,
  INVALID_STAGE_INDEX,
  INVALID_RECIPIENT,

  STAKING_REWARDS_EXHAUSTED,
};

/**
 * Returns the category a given error code belongs to.
 */
ErrorCategory GetCategory (ErrorCode code);

/**
 * Converts an error code to a string for logging and JSON.
 */
std::string ErrorCodeToString (ErrorCode code);

/**
 * Converts a category to a string.
 */
std::string ErrorCategoryToString (ErrorCategory cat);

/**
 * The result of an operation:  Either success, or an error code together
 * with a human-readable message.
 */
class OpStatus
{

private:

  ErrorCode code;
  std::string message;

public:

  /**
   * Constructs a success status.
   */
  OpStatus ()
    : code(ErrorCode::OK)
  {}

  explicit OpStatus (ErrorCode c, const std::string& msg);

  OpStatus (const OpStatus&) = default;
  OpStatus& operator= (const OpStatus&) = default;

  bool
  IsOk () const
  {
    return code == ErrorCode::OK;
  }

  ErrorCode
  GetCode () const
  {
    return code;
  }

  ErrorCategory
  GetCategory () const
  {
    return lpd::GetCategory (code);
  }

  const std::string&
  GetMessage () const
  {
    return message;
  }

};

std::ostream& operator<< (std::ostream& out, const OpStatus& s);

} // namespace lpd

#endif // LPD_ERRORS_HPP
