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

#include "stages.hpp"

#include <glog/logging.h>

namespace lpd
{

namespace
{

struct StageResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, idx, 1);
  RESULT_COLUMN (int64_t, stage, 2);
  RESULT_COLUMN (int64_t, price, 3);
  RESULT_COLUMN (int64_t, tokens_sold, 4);
  RESULT_COLUMN (int64_t, total_raised, 5);
};

PresaleStage
StageFromResult (const Database::Result<StageResult>& res)
{
  PresaleStage s;
  s.index = res.Get<StageResult::idx> ();
  s.stage = res.Get<StageResult::stage> ();
  s.price = AmountFromColumn (res.Get<StageResult::price> ());
  s.tokensSold = AmountFromColumn (res.Get<StageResult::tokens_sold> ());
  s.totalRaised = AmountFromColumn (res.Get<StageResult::total_raised> ());
  CHECK_EQ (s.stage, s.index + 1);
  return s;
}

} // anonymous namespace

bool
PresaleStageTable::IsInitialised ()
{
  PresaleStage dummy;
  return Get (0, dummy);
}

void
PresaleStageTable::Initialise (const std::vector<PresaleStage>& schedule)
{
  CHECK_EQ (schedule.size (), NUM_STAGES) << "Invalid stage schedule";
  CHECK (!IsInitialised ()) << "Stage table has already been initialised";

  VLOG (1) << "Initialising presale stage table";

  auto stmt = db.Prepare (R"(
    INSERT INTO `presale_stages`
      (`idx`, `stage`, `price`, `tokens_sold`, `total_raised`)
      VALUES (?1, ?2, ?3, ?4, ?5)
  )");

  for (unsigned i = 0; i < NUM_STAGES; ++i)
    {
      stmt.Reset ();
      stmt.Bind (1, i);
      stmt.Bind (2, i + 1);
      stmt.Bind (3, AmountToColumn (schedule[i].price));
      stmt.Bind (4, AmountToColumn (schedule[i].tokensSold));
      stmt.Bind (5, AmountToColumn (schedule[i].totalRaised));
      stmt.Execute ();
    }
}

bool
PresaleStageTable::Get (const unsigned index, PresaleStage& out)
{
  if (index >= NUM_STAGES)
    return false;

  auto stmt = db.Prepare ("SELECT * FROM `presale_stages` WHERE `idx` = ?1");
  stmt.Bind (1, index);
  auto res = stmt.Query<StageResult> ();

  if (!res.Step ())
    return false;

  out = StageFromResult (res);
  CHECK (!res.Step ());
  return true;
}

bool
PresaleStageTable::Update (const unsigned index, const Amount price,
                           const Amount tokensSold, const Amount totalRaised)
{
  PresaleStage cur;
  if (!Get (index, cur))
    {
      LOG (WARNING) << "Invalid presale stage index: " << index;
      return false;
    }

  VLOG (1)
      << "Updating presale stage " << index << ": price " << price
      << ", sold " << tokensSold << ", raised " << totalRaised;

  auto stmt = db.Prepare (R"(
    UPDATE `presale_stages`
      SET `price` = ?2, `tokens_sold` = ?3, `total_raised` = ?4
      WHERE `idx` = ?1
  )");
  stmt.Bind (1, index);
  stmt.Bind (2, AmountToColumn (price));
  stmt.Bind (3, AmountToColumn (tokensSold));
  stmt.Bind (4, AmountToColumn (totalRaised));
  stmt.Execute ();

  return true;
}

std::vector<PresaleStage>
PresaleStageTable::GetAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `presale_stages`
      ORDER BY `idx`
  )");
  auto res = stmt.Query<StageResult> ();

  std::vector<PresaleStage> stages;
  while (res.Step ())
    stages.push_back (StageFromResult (res));

  CHECK (stages.empty () || stages.size () == NUM_STAGES)
      << "Stage table has " << stages.size () << " entries";

  return stages;
}

} // namespace lpd
