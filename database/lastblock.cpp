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
#include "lastblock.hpp"

#include <glog/logging.h>

namespace lpd
{

namespace
{

struct LastBlockResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, height, 1);
  RESULT_COLUMN (int64_t, timestamp, 2);
};

} // anonymous namespace

void
LastBlock::Set (const unsigned height, const Timestamp timestamp)
{
  VLOG (1) << "Last block: height " << height << ", time " << timestamp;

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `last_block`
      (`id`, `height`, `timestamp`)
      VALUES (1, ?1, ?2)
  )");

  stmt.Bind (1, height);
  stmt.Bind (2, timestamp);
  stmt.Execute ();
}

bool
LastBlock::Get (unsigned& height, Timestamp& timestamp)
{
  auto stmt = db.Prepare (R"(
    SELECT `height`, `timestamp`
      FROM `last_block`
      WHERE `id` = 1
  )");
  auto res = stmt.Query<LastBlockResult> ();

  if (!res.Step ())
    return false;

  height = res.Get<LastBlockResult::height> ();
  timestamp = res.Get<LastBlockResult::timestamp> ();
  CHECK (!res.Step ());

  return true;
}

} // namespace lpd
