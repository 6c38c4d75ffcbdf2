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

#ifndef LPD_LIQUIDITY_HPP
#define LPD_LIQUIDITY_HPP

#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"

#include "database/database.hpp"

#include <string>

namespace lpd
{

/**
 * Moves the presale's liquidity into the vault.  This is possible only
 * in the window between the presale end and the lock deadline.
 */
class LiquidityLock
{

private:

  Database& db;
  Ledger& ledger;
  const Context& ctx;

public:

  explicit LiquidityLock (Database& d, Ledger& l, const Context& c)
    : db(d), ledger(l), ctx(c)
  {}

  LiquidityLock () = delete;
  LiquidityLock (const LiquidityLock&) = delete;
  void operator= (const LiquidityLock&) = delete;

  /**
   * Locks all of the liquidity holding into the vault.  Anyone may
   * trigger this.
   */
  OpStatus Lock (const std::string& caller);

};

} // namespace lpd

#endif // LPD_LIQUIDITY_HPP
