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

#include "errors.hpp"

#include <glog/logging.h>

namespace lpd
{

ErrorCategory
GetCategory (const ErrorCode code)
{
  switch (code)
    {
    case ErrorCode::OK:
      return ErrorCategory::NONE;

    case ErrorCode::ALREADY_INITIALISED:
    case ErrorCode::NOT_INITIALISED:
    case ErrorCode::ALREADY_ENDED:
    case ErrorCode::STAKING_CLOSED:
    case ErrorCode::INVALID_AMOUNT:
    case ErrorCode::EARLY_UNSTAKE_LOCKED:
    case ErrorCode::NO_REWARDS_AVAILABLE:
    case ErrorCode::LIQUIDITY_LOCK_ERROR:
    case ErrorCode::WITHDRAWAL_NOT_ALLOWED:
      return ErrorCategory::PRECONDITION_VIOLATION;

    case ErrorCode::ARITHMETIC_FAULT:
      return ErrorCategory::ARITHMETIC_FAULT;

    case ErrorCode::INSUFFICIENT_FUNDS:
    case ErrorCode::INSUFFICIENT_REWARDS:
      return ErrorCategory::INSUFFICIENT_BALANCE;

    case ErrorCode::UNAUTHORIZED:
      return ErrorCategory::UNAUTHORIZED;

    case ErrorCode::INVALID_FEE_RECIPIENT:
    case ErrorCode::INVALID_TOKEN_MINT:
    case ErrorCode::INVALID_STAGE_INDEX:
    case ErrorCode::INVALID_RECIPIENT:
      return ErrorCategory::INVALID_REFERENCE;

    case ErrorCode::STAKING_REWARDS_EXHAUSTED:
      return ErrorCategory::RESOURCE_EXHAUSTED;
    }

  LOG (FATAL) << "Invalid error code: " << static_cast<int> (code);
}

std::string
ErrorCodeToString (const ErrorCode code)
{
  switch (code)
    {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::ALREADY_INITIALISED:
      return "already initialised";
    case ErrorCode::NOT_INITIALISED:
      return "not initialised";
    case ErrorCode::ALREADY_ENDED:
      return "already ended";
    case ErrorCode::STAKING_CLOSED:
      return "staking closed";
    case ErrorCode::INVALID_AMOUNT:
      return "invalid amount";
    case ErrorCode::EARLY_UNSTAKE_LOCKED:
      return "early unstake locked";
    case ErrorCode::NO_REWARDS_AVAILABLE:
      return "no rewards available";
    case ErrorCode::LIQUIDITY_LOCK_ERROR:
      return "liquidity lock error";
    case ErrorCode::WITHDRAWAL_NOT_ALLOWED:
      return "withdrawal not allowed";
    case ErrorCode::ARITHMETIC_FAULT:
      return "arithmetic fault";
    case ErrorCode::INSUFFICIENT_FUNDS:
      return "insufficient funds";
    case ErrorCode::INSUFFICIENT_REWARDS:
      return "insufficient rewards";
    case ErrorCode::UNAUTHORIZED:
      return "unauthorized";
    case ErrorCode::INVALID_FEE_RECIPIENT:
      return "invalid fee recipient";
    case ErrorCode::INVALID_TOKEN_MINT:
      return "invalid token mint";
    case ErrorCode::INVALID_STAGE_INDEX:
      return "invalid stage index";
    case ErrorCode::INVALID_RECIPIENT:
      return "invalid recipient";
    case ErrorCode::STAKING_REWARDS_EXHAUSTED:
      return "staking rewards exhausted";
    }

  LOG (FATAL) << "Invalid error code: " << static_cast<int> (code);
}

std::string
ErrorCategoryToString (const ErrorCategory cat)
{
  switch (cat)
    {
    case ErrorCategory::NONE:
      return "none";
    case ErrorCategory::PRECONDITION_VIOLATION:
      return "precondition violation";
    case ErrorCategory::ARITHMETIC_FAULT:
      return "arithmetic fault";
    case ErrorCategory::INSUFFICIENT_BALANCE:
      return "insufficient balance";
    case ErrorCategory::UNAUTHORIZED:
      return "unauthorized";
    case ErrorCategory::INVALID_REFERENCE:
      return "invalid reference";
    case ErrorCategory::RESOURCE_EXHAUSTED:
      return "resource exhausted";
    }

  LOG (FATAL) << "Invalid error category: " << static_cast<int> (cat);
}

OpStatus::OpStatus (const ErrorCode c, const std::string& msg)
  : code(c), message(msg)
{
  CHECK (code != ErrorCode::OK) << "Error status constructed with OK code";
}

std::ostream&
operator<< (std::ostream& out, const OpStatus& s)
{
  if (s.IsOk ())
    return out << "ok";

  out << ErrorCodeToString (s.GetCode ())
      << " (" << ErrorCategoryToString (s.GetCategory ()) << ")";
  if (!s.GetMessage ().empty ())
    out << ": " << s.GetMessage ();

  return out;
}

} // namespace lpd
