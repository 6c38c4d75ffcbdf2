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

#include "presale.hpp"

#include "testutils.hpp"

#include "database/dbtest.hpp"
#include "database/presale.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

namespace lpd
{
namespace
{

class PresaleControllerTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;
  StoredAdminPolicy auth;
  PresaleController presale;

  PresaleTable tbl;

  PresaleControllerTests ()
    : auth(db), presale(db, auth, ctx), tbl(db)
  {}

};

TEST_F (PresaleControllerTests, Initialise)
{
  ASSERT_TRUE (presale.Initialise ("admin").IsOk ());

  auto p = tbl.Get ();
  ASSERT_NE (p, nullptr);
  EXPECT_TRUE (p->IsActive ());
  EXPECT_EQ (p->GetAdmin (), "admin");
  EXPECT_FALSE (p->HasEndTime ());
  EXPECT_FALSE (p->HasLaunchTime ());
  EXPECT_FALSE (p->HasLiquidityLockEnd ());
  EXPECT_FALSE (p->IsLiquidityLocked ());
}

TEST_F (PresaleControllerTests, InitialiseTwice)
{
  ASSERT_TRUE (presale.Initialise ("admin").IsOk ());

  const auto res = presale.Initialise ("domob");
  EXPECT_EQ (res.GetCode (), ErrorCode::ALREADY_INITIALISED);
  EXPECT_EQ (res.GetCategory (), ErrorCategory::PRECONDITION_VIOLATION);
  EXPECT_EQ (tbl.Get ()->GetAdmin (), "admin");
}

TEST_F (PresaleControllerTests, End)
{
  ASSERT_TRUE (presale.Initialise ("admin").IsOk ());
  ctx.SetTimestamp (2'000'000);
  ASSERT_TRUE (presale.End ("admin").IsOk ());

  auto p = tbl.Get ();
  EXPECT_FALSE (p->IsActive ());
  EXPECT_EQ (p->GetEndTime (), 2'000'000);
  EXPECT_EQ (p->GetLaunchTime (), 2'000'000);
  EXPECT_EQ (p->GetLiquidityLockEnd (), 2'000'000 + 365 * SECONDS_PER_DAY);
  EXPECT_FALSE (p->IsLiquidityLocked ());
}

TEST_F (PresaleControllerTests, EndTwice)
{
  ASSERT_TRUE (presale.Initialise ("admin").IsOk ());
  ASSERT_TRUE (presale.End ("admin").IsOk ());

  ctx.SetTimestamp (ctx.Timestamp () + 100);
  EXPECT_EQ (presale.End ("admin").GetCode (), ErrorCode::ALREADY_ENDED);
  EXPECT_EQ (tbl.Get ()->GetEndTime (), ctx.Timestamp () - 100);
}

TEST_F (PresaleControllerTests, EndUnauthorised)
{
  ASSERT_TRUE (presale.Initialise ("admin").IsOk ());

  const auto res = presale.End ("domob");
  EXPECT_EQ (res.GetCode (), ErrorCode::UNAUTHORIZED);
  EXPECT_EQ (res.GetCategory (), ErrorCategory::UNAUTHORIZED);
  EXPECT_TRUE (tbl.Get ()->IsActive ());
}

TEST_F (PresaleControllerTests, EndBeforeInitialisation)
{
  const std::set<std::string> names = {"admin"};
  PrincipalSetPolicy principals(names);
  PresaleController withPrincipals(db, principals, ctx);
  EXPECT_EQ (withPrincipals.End ("admin").GetCode (),
             ErrorCode::NOT_INITIALISED);
}

} // anonymous namespace
} // namespace lpd
