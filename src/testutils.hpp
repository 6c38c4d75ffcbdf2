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

#ifndef LPD_TESTUTILS_HPP
#define LPD_TESTUTILS_HPP

#include "context.hpp"

#include "proto/config.pb.h"

#include <xayagame/gamelogic.hpp>

#include <json/json.h>

#include <set>
#include <string>

namespace lpd
{

/**
 * Context instance that can modify certain fields (like the block timestamp
 * or some of the rule parameters).
 */
class ContextForTesting : public Context
{

public:

  ContextForTesting ()
    : Context(xaya::Chain::REGTEST)
  {
    SetChain (chain);
    SetHeight (1);
    SetTimestamp (1'000'000);
  }

  void SetChain (xaya::Chain c);
  void SetHeight (const unsigned h);
  void SetTimestamp (const int64_t ts);

  void SetStakeClock (proto::StakeClockMode mode);
  void SetAdminPrincipals (const std::set<std::string>& names);
  void SetGodMode (bool val);

};

/**
 * Parses a string into JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Checks for "partial equality" of the given JSON values.  This means that
 * keys not present in the expected value (if it is an object) are not checked
 * in the actual value at all.  If keys have a value of null in expected,
 * then they must not be there in actual at all.
 */
bool PartialJsonEqual (const Json::Value& actual, const Json::Value& expected);

} // namespace lpd

#endif // LPD_TESTUTILS_HPP
