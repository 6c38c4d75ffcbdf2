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

#ifndef DATABASE_BALANCES_HPP
#define DATABASE_BALANCES_HPP

#include "amount.hpp"
#include "database.hpp"

#include <string>

namespace lpd
{

/**
 * Database result type for rows of the balances table.
 */
struct BalanceResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, holding, 1);
  RESULT_COLUMN (std::string, currency, 2);
  RESULT_COLUMN (int64_t, amount, 3);
};

/**
 * Raw access to the balances book.  Holdings that have a zero balance
 * for some currency have no row at all.  This class does no validation
 * of transfers; that is done by the ledger on top of it.
 */
class BalancesTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  explicit BalancesTable (Database& d)
    : db(d)
  {}

  BalancesTable () = delete;
  BalancesTable (const BalancesTable&) = delete;
  void operator= (const BalancesTable&) = delete;

  /**
   * Returns the balance of the given holding in some currency.
   */
  Amount Get (const std::string& holding, const std::string& currency);

  /**
   * Sets the balance of the given holding in some currency.
   */
  void Set (const std::string& holding, const std::string& currency,
            Amount amount);

  /**
   * Queries for all non-zero balances, ordered by holding and currency.
   */
  Database::Result<BalanceResult> QueryAll ();

  /**
   * Computes the total amount of the given currency held by all holdings.
   * Returns false if that overflows.
   */
  bool SumCurrency (const std::string& currency, Amount& total);

};

} // namespace lpd

#endif // DATABASE_BALANCES_HPP
