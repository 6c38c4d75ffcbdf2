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

#include "balances.hpp"

#include <glog/logging.h>

namespace lpd
{

Amount
BalancesTable::Get (const std::string& holding, const std::string& currency)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `balances`
      WHERE `holding` = ?1 AND `currency` = ?2
  )");
  stmt.Bind (1, holding);
  stmt.Bind (2, currency);
  auto res = stmt.Query<BalanceResult> ();

  if (!res.Step ())
    return 0;

  const Amount amount = AmountFromColumn (res.Get<BalanceResult::amount> ());
  CHECK (!res.Step ());
  CHECK_GT (amount, 0)
      << "Zero balance stored for " << holding << " in " << currency;

  return amount;
}

void
BalancesTable::Set (const std::string& holding, const std::string& currency,
                    const Amount amount)
{
  VLOG (2)
      << "Setting balance of " << holding << " in " << currency
      << " to " << amount;

  if (amount == 0)
    {
      auto stmt = db.Prepare (R"(
        DELETE FROM `balances`
          WHERE `holding` = ?1 AND `currency` = ?2
      )");
      stmt.Bind (1, holding);
      stmt.Bind (2, currency);
      stmt.Execute ();
      return;
    }

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `balances`
      (`holding`, `currency`, `amount`)
      VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, holding);
  stmt.Bind (2, currency);
  stmt.Bind (3, AmountToColumn (amount));
  stmt.Execute ();
}

Database::Result<BalanceResult>
BalancesTable::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `balances`
      ORDER BY `holding`, `currency`
  )");
  return stmt.Query<BalanceResult> ();
}

bool
BalancesTable::SumCurrency (const std::string& currency, Amount& total)
{
  total = 0;

  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `balances`
      WHERE `currency` = ?1
  )");
  stmt.Bind (1, currency);
  auto res = stmt.Query<BalanceResult> ();

  while (res.Step ())
    {
      const Amount cur = AmountFromColumn (res.Get<BalanceResult::amount> ());
      if (!CheckedAdd (total, cur, total))
        return false;
    }

  return true;
}

} // namespace lpd
