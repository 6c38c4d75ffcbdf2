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

#include "payments.hpp"

#include "testutils.hpp"

#include "database/balances.hpp"
#include "database/dbtest.hpp"
#include "database/supplystats.hpp"

#include <gtest/gtest.h>

namespace lpd
{
namespace
{

class PaymentProcessorTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;
  DatabaseLedger ledger;
  PaymentProcessor payments;

  BalancesTable balances;
  SupplyStats stats;

  std::string native;
  std::string token;
  std::string treasury;
  std::string fees;

  PaymentProcessorTests ()
    : ledger(db, ctx.RoConfig ()->currencies ().token ()),
      payments(db, ledger, ctx),
      balances(db), stats(db),
      native(ctx.RoConfig ()->currencies ().native ()),
      token(ctx.RoConfig ()->currencies ().token ()),
      treasury(ctx.RoConfig ()->holdings ().treasury ()),
      fees(ctx.RoConfig ()->holdings ().fee_recipient ())
  {
    balances.Set (AccountHolding ("domob"), native, 10'000);
    balances.Set (AccountHolding ("domob"), token, 5'000);
  }

  Amount
  Balance (const std::string& holding, const std::string& currency)
  {
    return balances.Get (holding, currency);
  }

};

TEST_F (PaymentProcessorTests, NativeFeeSplit)
{
  ASSERT_TRUE (payments.AcceptPayment ("domob", 1'000, native, {}).IsOk ());

  EXPECT_EQ (Balance (treasury, native), 997);
  EXPECT_EQ (Balance (fees, native), 3);
  EXPECT_EQ (Balance (AccountHolding ("domob"), native), 9'000);
  EXPECT_EQ (stats.Get ("fees"), 0);
}

TEST_F (PaymentProcessorTests, TokenFeeSplit)
{
  ASSERT_TRUE (payments.AcceptPayment ("domob", 1'000, token, {}).IsOk ());

  EXPECT_EQ (Balance (treasury, token), 997);
  EXPECT_EQ (Balance (fees, token), 3);
  EXPECT_EQ (Balance (AccountHolding ("domob"), token), 4'000);
  EXPECT_EQ (stats.Get ("fees"), 3);
}

TEST_F (PaymentProcessorTests, AmountMustExceedFee)
{
  EXPECT_EQ (payments.AcceptPayment ("domob", 3, native, {}).GetCode (),
             ErrorCode::INVALID_AMOUNT);
  EXPECT_EQ (payments.AcceptPayment ("domob", 0, token, {}).GetCode (),
             ErrorCode::INVALID_AMOUNT);

  ASSERT_TRUE (payments.AcceptPayment ("domob", 4, native, {}).IsOk ());
  EXPECT_EQ (Balance (treasury, native), 1);
  EXPECT_EQ (Balance (fees, native), 3);
}

TEST_F (PaymentProcessorTests, InsufficientFunds)
{
  EXPECT_EQ (payments.AcceptPayment ("domob", 5'001, token, {}).GetCode (),
             ErrorCode::INSUFFICIENT_FUNDS);
  EXPECT_EQ (payments.AcceptPayment ("domob", 10'001, native, {}).GetCode (),
             ErrorCode::INSUFFICIENT_FUNDS);
  EXPECT_EQ (payments.AcceptPayment ("andy", 100, native, {}).GetCode (),
             ErrorCode::INSUFFICIENT_FUNDS);

  EXPECT_EQ (Balance (AccountHolding ("domob"), token), 5'000);
  EXPECT_EQ (Balance (treasury, token), 0);
}

TEST_F (PaymentProcessorTests, UnknownCurrency)
{
  EXPECT_EQ (payments.AcceptPayment ("domob", 100, "lp", {}).GetCode (),
             ErrorCode::INVALID_TOKEN_MINT);
  EXPECT_EQ (payments.AcceptPayment ("domob", 100, "foo", {}).GetCode (),
             ErrorCode::INVALID_TOKEN_MINT);
}

TEST_F (PaymentProcessorTests, Route)
{
  PaymentRoute route;
  route.treasury = treasury;
  route.feeRecipient = fees;
  ASSERT_TRUE (payments.AcceptPayment ("domob", 100, native, route).IsOk ());
  EXPECT_EQ (Balance (treasury, native), 97);

  route.feeRecipient = "p/domob";
  EXPECT_EQ (payments.AcceptPayment ("domob", 100, native, route).GetCode (),
             ErrorCode::INVALID_FEE_RECIPIENT);

  route.feeRecipient.clear ();
  route.treasury = "presale/other";
  EXPECT_EQ (payments.AcceptPayment ("domob", 100, native, route).GetCode (),
             ErrorCode::INVALID_FEE_RECIPIENT);

  EXPECT_EQ (Balance (treasury, native), 97);
}

TEST_F (PaymentProcessorTests, DepositNative)
{
  ASSERT_TRUE (payments.DepositNative ("domob", 1'000).IsOk ());
  EXPECT_EQ (Balance (treasury, native), 1'000);
  EXPECT_EQ (Balance (AccountHolding ("domob"), native), 9'000);
  EXPECT_EQ (stats.Get ("fees"), 0);

  EXPECT_EQ (payments.DepositNative ("domob", 9'001).GetCode (),
             ErrorCode::INSUFFICIENT_FUNDS);
}

TEST_F (PaymentProcessorTests, CreditFromChain)
{
  ASSERT_TRUE (payments.CreditFromChain ("andy", 500).IsOk ());
  EXPECT_EQ (Balance (AccountHolding ("andy"), native), 500);

  /* Native coins are not part of the token supply.  */
  EXPECT_EQ (stats.Get ("minted"), 0);
}

} // anonymous namespace
} // namespace lpd
