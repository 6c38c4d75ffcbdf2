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

#ifndef LPD_PARAMS_HPP
#define LPD_PARAMS_HPP

#include "database/amount.hpp"
#include "proto/config.pb.h"
#include "proto/roconfig.hpp"

#include <set>
#include <string>

namespace lpd
{

/**
 * The rules of the presale economy in the form they are used by the
 * engines, e.g. with durations converted to seconds.  Instances are
 * derived from the roconfig data for a chain.  Unit tests can tweak the
 * values through ContextForTesting.
 */
class Params
{

private:

  Amount flatFee;

  Timestamp stakingDuration;
  Timestamp earlyUnstakeLock;
  Timestamp liquidityLockDuration;

  Amount penaltyPercent;

  proto::StakeClockMode stakeClock;

  /** Configured admin principals (may be empty).  */
  std::set<std::string> adminPrincipals;

  bool godMode;

  friend class ContextForTesting;

public:

  /**
   * Constructs the parameters from the raw protocol buffer data.
   */
  explicit Params (const proto::Params& pb);

  explicit Params (const RoConfig& cfg)
    : Params(cfg->params ())
  {}

  Params () = delete;
  Params (const Params&) = delete;
  void operator= (const Params&) = delete;

  /**
   * Returns the flat fee taken from each payment.
   */
  Amount
  FlatFee () const
  {
    return flatFee;
  }

  /**
   * Returns the full staking term (after which unstaking is free of
   * penalties) in seconds.  This is also the period over which the APY
   * is paid out as rewards.
   */
  Timestamp
  StakingDuration () const
  {
    return stakingDuration;
  }

  /**
   * Returns the time after the launch during which unstaking is locked.
   */
  Timestamp
  EarlyUnstakeLock () const
  {
    return earlyUnstakeLock;
  }

  /**
   * Returns the length of the window after the presale end in which
   * liquidity can be locked.
   */
  Timestamp
  LiquidityLockDuration () const
  {
    return liquidityLockDuration;
  }

  Amount
  PenaltyPercent () const
  {
    return penaltyPercent;
  }

  proto::StakeClockMode
  StakeClock () const
  {
    return stakeClock;
  }

  const std::set<std::string>&
  AdminPrincipals () const
  {
    return adminPrincipals;
  }

  /**
   * Returns true if god-mode commands are allowed.
   */
  bool
  GodMode () const
  {
    return godMode;
  }

};

} // namespace lpd

#endif // LPD_PARAMS_HPP
