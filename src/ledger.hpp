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

#ifndef LPD_LEDGER_HPP
#define LPD_LEDGER_HPP

#include "errors.hpp"

#include "database/amount.hpp"
#include "database/balances.hpp"
#include "database/database.hpp"
#include "database/supplystats.hpp"

#include <string>

namespace lpd
{

/**
 * Returns the ledger holding that belongs to the Xaya account with the
 * given name.  Account holdings are prefixed, so that they can never
 * clash with the special holdings of the presale.
 */
std::string AccountHolding (const std::string& name);

/**
 * Interface for the token service that keeps balances of holdings in
 * the various currencies.  The presale economy moves all funds through
 * an instance of this.  Failures are reported through the returned
 * status, and a failed call must not have changed anything.
 */
class Ledger
{

protected:

  Ledger () = default;

public:

  virtual ~Ledger () = default;

  Ledger (const Ledger&) = delete;
  void operator= (const Ledger&) = delete;

  /**
   * Returns the balance of a holding in the given currency.
   */
  virtual Amount GetBalance (const std::string& currency,
                             const std::string& holding) = 0;

  /**
   * Moves the given amount from one holding to another.
   */
  virtual OpStatus Transfer (const std::string& currency,
                             const std::string& from, const std::string& to,
                             Amount amount) = 0;

  /**
   * Destroys the given amount from a holding.
   */
  virtual OpStatus Burn (const std::string& currency,
                         const std::string& holding, Amount amount) = 0;

  /**
   * Creates the given amount in a holding.
   */
  virtual OpStatus Mint (const std::string& currency,
                         const std::string& holding, Amount amount) = 0;

};

/**
 * Ledger implementation that keeps the balances in the game-state database.
 * Burns and mints of the presale token are tracked in the supply statistics,
 * so that its total supply is always minted minus burnt.
 */
class DatabaseLedger : public Ledger
{

private:

  BalancesTable balances;
  SupplyStats stats;

  /** The currency for which burns and mints are tracked.  */
  const std::string token;

public:

  explicit DatabaseLedger (Database& db, const std::string& t)
    : balances(db), stats(db), token(t)
  {}

  Amount GetBalance (const std::string& currency,
                     const std::string& holding) override;

  OpStatus Transfer (const std::string& currency,
                     const std::string& from, const std::string& to,
                     Amount amount) override;

  OpStatus Burn (const std::string& currency,
                 const std::string& holding, Amount amount) override;

  OpStatus Mint (const std::string& currency,
                 const std::string& holding, Amount amount) override;

};

} // namespace lpd

#endif // LPD_LEDGER_HPP
