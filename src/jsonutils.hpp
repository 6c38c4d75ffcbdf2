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

#ifndef LPD_JSONUTILS_HPP
#define LPD_JSONUTILS_HPP

#include "database/amount.hpp"

#include <json/json.h>

#include <string>

namespace lpd
{

/**
 * Parses a token or currency amount from a move.  It must be a non-negative
 * integer that fits into an Amount.  Zero is accepted here; whether it is
 * valid for the operation is decided by the operation itself.
 */
bool AmountFromJson (const Json::Value& val, Amount& amount);

/**
 * Parses a CHI amount as included in the "out" field of a move by
 * libxayagame, and converts it to Satoshi.
 */
bool ChiFromJson (const Json::Value& val, Amount& amount);

/**
 * Parses a stage index from JSON.  The range is not checked here except
 * that it must fit into an unsigned int.
 */
bool StageIndexFromJson (const Json::Value& val, unsigned& index);

/**
 * Extracts a string member from a JSON object.  Returns false if the
 * member is present but not a string.  If it is missing, the output is
 * set to the empty string.
 */
bool OptionalStringFromJson (const Json::Value& obj, const std::string& key,
                             std::string& out);

/**
 * Converts an integer value to the proper JSON representation.
 */
template <typename T>
  Json::Value IntToJson (T val);

} // namespace lpd

#endif // LPD_JSONUTILS_HPP
