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

#ifndef DATABASE_AMOUNT_HPP
#define DATABASE_AMOUNT_HPP

#include <cstdint>
#include <limits>

namespace lpd
{

/**
 * An amount of some currency held in the ledger (native CHI in satoshi or
 * base units of a token).  Amounts are unsigned, and all arithmetic on them
 * that could overflow or underflow goes through the checked helpers below.
 */
using Amount = uint64_t;

/** A timestamp in seconds, as given by the block time.  */
using Timestamp = int64_t;

/** Number of seconds in a day.  */
constexpr Timestamp SECONDS_PER_DAY = 24 * 3'600;

/**
 * Converts an amount to the signed 64-bit integer stored in SQLite.  The
 * conversion preserves the bit pattern, so that the full unsigned range
 * can be stored and read back with AmountFromColumn.
 */
inline int64_t
AmountToColumn (const Amount a)
{
  return static_cast<int64_t> (a);
}

/**
 * Converts a database column value back to an amount.
 */
inline Amount
AmountFromColumn (const int64_t val)
{
  return static_cast<Amount> (val);
}

/**
 * Computes a + b.  Returns false if the result overflows.
 */
inline bool
CheckedAdd (const Amount a, const Amount b, Amount& res)
{
  if (a > std::numeric_limits<Amount>::max () - b)
    return false;
  res = a + b;
  return true;
}

/**
 * Computes a - b.  Returns false if b is larger than a.
 */
inline bool
CheckedSub (const Amount a, const Amount b, Amount& res)
{
  if (b > a)
    return false;
  res = a - b;
  return true;
}

/**
 * Computes a * b.  Returns false if the result overflows.
 */
inline bool
CheckedMul (const Amount a, const Amount b, Amount& res)
{
  if (a != 0 && b > std::numeric_limits<Amount>::max () / a)
    return false;
  res = a * b;
  return true;
}

/**
 * Computes a / b, truncating.  Returns false for a division by zero.
 */
inline bool
CheckedDiv (const Amount a, const Amount b, Amount& res)
{
  if (b == 0)
    return false;
  res = a / b;
  return true;
}

/**
 * Computes the number of seconds between from and to, which must not
 * be negative (the clock is monotonic).  Returns false if to is before from.
 */
inline bool
CheckedElapsed (const Timestamp from, const Timestamp to, Amount& res)
{
  if (to < from)
    return false;
  res = static_cast<Amount> (to) - static_cast<Amount> (from);
  return true;
}

} // namespace lpd

#endif // DATABASE_AMOUNT_HPP
