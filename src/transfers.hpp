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
#ifndef LPD_TRANSFERS_HPP
#define LPD_TRANSFERS_HPP

#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"

#include "database/amount.hpp"

#include <string>

namespace lpd
{

/**
 * Transfers and burns of tokens between the accounts of players.  This is
 * how tokens get from the initial allocation to everyone else.
 */
class TokenTransfers
{

private:

  Ledger& ledger;
  const Context& ctx;

public:

  explicit TokenTransfers (Ledger& l, const Context& c)
    : ledger(l), ctx(c)
  {}

  TokenTransfers () = delete;
  TokenTransfers (const TokenTransfers&) = delete;
  void operator= (const TokenTransfers&) = delete;

  /**
   * Sends tokens from the caller's account to the account of the
   * recipient.  Transfers to oneself succeed without doing anything.
   */
  OpStatus Transfer (const std::string& caller, const std::string& recipient,
                     Amount amount);

  /**
   * Destroys tokens from the caller's own account.
   */
  OpStatus Burn (const std::string& caller, Amount amount);

};

} // namespace lpd

#endif // LPD_TRANSFERS_HPP
