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

#ifndef LPD_UNSTAKE_HPP
#define LPD_UNSTAKE_HPP

#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"

#include <string>

namespace lpd
{

/**
 * Withdraws stakes again.  Stakes withdrawn before the full term are
 * penalised, and the penalty is burnt.
 */
class UnstakeEngine
{

private:

  Database& db;
  Ledger& ledger;
  const Context& ctx;

public:

  explicit UnstakeEngine (Database& d, Ledger& l, const Context& c)
    : db(d), ledger(l), ctx(c)
  {}

  UnstakeEngine () = delete;
  UnstakeEngine (const UnstakeEngine&) = delete;
  void operator= (const UnstakeEngine&) = delete;

  /**
   * Withdraws the caller's full stake.
   */
  OpStatus Unstake (const std::string& caller);

};

} // namespace lpd

#endif // LPD_UNSTAKE_HPP
