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

#include "supplystats.hpp"

#include <glog/logging.h>

namespace lpd
{

namespace
{

struct SupplyStatsResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, key, 1);
  RESULT_COLUMN (int64_t, amount, 2);
};

} // anonymous namespace

Amount
SupplyStats::Get (const std::string& key)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `supply_stats`
      WHERE `key` = ?1
  )");
  stmt.Bind (1, key);

  auto res = stmt.Query<SupplyStatsResult> ();
  CHECK (res.Step ()) << "Invalid key: " << key;

  const Amount amount
      = AmountFromColumn (res.Get<SupplyStatsResult::amount> ());
  CHECK (!res.Step ());

  return amount;
}

bool
SupplyStats::Increment (const std::string& key, const Amount value)
{
  VLOG (1)
      << "Incrementing supply statistic " << key
      << " by " << value;
  CHECK_NE (GetValidKeys ().count (key), 0) << "Invalid key: " << key;
  CHECK_GT (value, 0);

  Amount total;
  if (!CheckedAdd (Get (key), value, total))
    {
      LOG (WARNING) << "Supply statistic " << key << " would overflow";
      return false;
    }

  auto stmt = db.Prepare (R"(
    UPDATE `supply_stats`
      SET `amount` = ?2
      WHERE `key` = ?1
  )");
  stmt.Bind (1, key);
  stmt.Bind (2, AmountToColumn (total));
  stmt.Execute ();

  return true;
}

void
SupplyStats::InitialiseDatabase ()
{
  auto stmt = db.Prepare (R"(
    INSERT INTO `supply_stats`
      (`key`, `amount`) VALUES (?1, 0)
  )");

  for (const auto& key : GetValidKeys ())
    {
      stmt.Reset ();
      stmt.Bind (1, key);
      stmt.Execute ();
    }
}

const std::set<std::string>&
SupplyStats::GetValidKeys ()
{
  static const std::set<std::string> keys =
    {
      "burnt",
      "fees",
      "minted",
      "rewards",
    };

  return keys;
}

} // namespace lpd
