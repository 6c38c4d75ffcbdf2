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

#ifndef LPD_CONTEXT_HPP
#define LPD_CONTEXT_HPP

#include "params.hpp"

#include "proto/roconfig.hpp"

#include <xayagame/gamelogic.hpp>

#include <memory>

namespace lpd
{

/**
 * Basic, read-only contextual data about the current block and the chain state
 * in general.  The data is immutable, except if using the ContextForTesting
 * subclass in unit tests.
 *
 * The block timestamp is the clock of the presale economy.  It is the same
 * for all moves in a block.
 */
class Context
{

private:

  /** The chain we are on.  */
  xaya::Chain chain;

  /** RoConfig instance dependant on the chain.  */
  std::unique_ptr<lpd::RoConfig> cfg;

  /**
   * Rule parameters dependant on the chain.  This is a pointer so that we
   * can recreate it with modified chain in tests.
   */
  std::unique_ptr<lpd::Params> params;

  /** The current block's height.  */
  unsigned height;

  /** The timestamp of the current block.  */
  int64_t timestamp;

  /**
   * Constructs an empty instance without setting any stuff yet.  This is
   * used with ContextForTesting.
   */
  explicit Context (xaya::Chain c);

  friend class ContextForTesting;

public:

  /** Value for timestamp if there is none (and it shouldn't be used).  */
  static constexpr int64_t NO_TIMESTAMP = -1;

  /** Value for height if there is no height set (and shouldn't be used).  */
  static constexpr unsigned NO_HEIGHT = static_cast<unsigned> (-1);

  /**
   * Constructs an instance based on the given data.
   */
  explicit Context (xaya::Chain c, unsigned h, int64_t ts);

  Context () = delete;
  Context (const Context&) = delete;
  void operator= (const Context&) = delete;

  xaya::Chain
  Chain () const
  {
    return chain;
  }

  const lpd::RoConfig&
  RoConfig () const
  {
    return *cfg;
  }

  const lpd::Params&
  Params () const
  {
    return *params;
  }

  /**
   * Returns the context's block height.  Must not be used if NO_HEIGHT was
   * passed to the constructor.
   */
  unsigned Height () const;

  /**
   * Returns the context's block timestamp, i.e. the current time.
   */
  int64_t Timestamp () const;

  bool
  HasTimestamp () const
  {
    return timestamp != NO_TIMESTAMP;
  }

};

} // namespace lpd

#endif // LPD_CONTEXT_HPP
