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

#include "jsonutils.hpp"

#include <xayautil/jsonutils.hpp>

#include <glog/logging.h>

#include <limits>

namespace lpd
{

bool
AmountFromJson (const Json::Value& val, Amount& amount)
{
  if (!val.isUInt64 () || !xaya::IsIntegerValue (val))
    return false;

  amount = val.asUInt64 ();
  return true;
}

bool
ChiFromJson (const Json::Value& val, Amount& amount)
{
  int64_t sat;
  if (!xaya::ChiAmountFromJson (val, sat))
    return false;

  if (sat < 0)
    return false;

  amount = static_cast<Amount> (sat);
  return true;
}

bool
StageIndexFromJson (const Json::Value& val, unsigned& index)
{
  if (!val.isUInt () || !xaya::IsIntegerValue (val))
    return false;

  index = val.asUInt ();
  return true;
}

bool
OptionalStringFromJson (const Json::Value& obj, const std::string& key,
                        std::string& out)
{
  CHECK (obj.isObject ());

  out.clear ();
  if (!obj.isMember (key))
    return true;

  const auto& val = obj[key];
  if (!val.isString ())
    {
      VLOG (1) << "Member " << key << " is not a string: " << val;
      return false;
    }

  out = val.asString ();
  return true;
}

template <>
  Json::Value
  IntToJson<int32_t> (const int32_t val)
{
  return static_cast<Json::Int> (val);
}

template <>
  Json::Value
  IntToJson<uint32_t> (const uint32_t val)
{
  return static_cast<Json::UInt> (val);
}

template <>
  Json::Value
  IntToJson<int64_t> (const int64_t val)
{
  return static_cast<Json::Int64> (val);
}

template <>
  Json::Value
  IntToJson<uint64_t> (const uint64_t val)
{
  return static_cast<Json::UInt64> (val);
}

} // namespace lpd
