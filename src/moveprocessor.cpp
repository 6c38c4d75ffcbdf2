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

#include "moveprocessor.hpp"

#include "jsonutils.hpp"

#include "proto/roconfig.hpp"

namespace lpd
{

namespace
{

/**
 * Logs a warning if the given operation did not succeed.  Failed operations
 * have no effect on the state, so that is all we need to do about them.
 */
void
LogFailure (const std::string& name, const std::string& op,
            const OpStatus& res)
{
  if (res.IsOk ())
    VLOG (1) << "Operation " << op << " of " << name << " succeeded";
  else
    LOG (WARNING) << "Operation " << op << " of " << name << " failed: " << res;
}

} // anonymous namespace

bool
MoveProcessor::ExtractMoveBasics (const Json::Value& moveObj,
                                  std::string& name, Json::Value& mv,
                                  Amount& paidToPresale) const
{
  VLOG (1) << "Processing move:\n" << moveObj;
  CHECK (moveObj.isObject ());

  CHECK (moveObj.isMember ("move"));
  mv = moveObj["move"];

  const auto& nameVal = moveObj["name"];
  CHECK (nameVal.isString ());
  name = nameVal.asString ();

  paidToPresale = 0;
  const auto& outVal = moveObj["out"];
  const auto& addr = ctx.RoConfig ()->params ().presale_address ();
  if (outVal.isObject () && outVal.isMember (addr))
    CHECK (ChiFromJson (outVal[addr], paidToPresale));

  if (!mv.isObject ())
    {
      LOG (WARNING) << "Move is not an object: " << mv;
      return false;
    }

  return true;
}

void
MoveProcessor::ProcessAll (const Json::Value& moveArray)
{
  CHECK (moveArray.isArray ());
  LOG (INFO) << "Processing " << moveArray.size () << " moves...";

  for (const auto& m : moveArray)
    ProcessOne (m);
}

void
MoveProcessor::ProcessOne (const Json::Value& moveObj)
{
  std::string name;
  Json::Value mv;
  Amount paidToPresale;
  const bool valid = ExtractMoveBasics (moveObj, name, mv, paidToPresale);

  /* Coins sent to the presale address are credited even if the move
     itself is invalid.  They have been paid on chain in any case.  */
  if (paidToPresale > 0)
    LogFailure (name, "credit",
                ops.CreditFromChain (name, paidToPresale));

  if (!valid)
    return;

  /* The order here is fixed, so that e.g. a payment and stake can be
     combined in a single move, and it is consensus relevant.  */
  TryPayment (name, mv["pay"]);
  TryDeposit (name, mv["deposit"]);
  TryStake (name, mv["stake"]);
  TryClaim (name, mv["claim"]);
  TryUnstake (name, mv["unstake"]);
  TryLiquidityLock (name, mv["lock"]);
  TryCoinOperation (name, mv["vc"]);
  TryAdminOperations (name, mv["adm"]);
}

void
MoveProcessor::TryPayment (const std::string& name, const Json::Value& cmd)
{
  if (cmd.isNull ())
    return;

  if (!cmd.isObject ())
    {
      LOG (WARNING) << "Payment by " << name << " is not an object: " << cmd;
      return;
    }

  Amount amount;
  if (!AmountFromJson (cmd["amount"], amount))
    {
      LOG (WARNING) << "Invalid payment amount by " << name << ": " << cmd;
      return;
    }

  const auto& currencyVal = cmd["currency"];
  if (!currencyVal.isString ())
    {
      LOG (WARNING) << "Invalid payment currency by " << name << ": " << cmd;
      return;
    }

  PaymentRoute route;
  if (!OptionalStringFromJson (cmd, "treasury", route.treasury)
        || !OptionalStringFromJson (cmd, "fee", route.feeRecipient))
    {
      LOG (WARNING) << "Invalid payment route by " << name << ": " << cmd;
      return;
    }

  LogFailure (name, "payment",
              ops.AcceptPayment (name, amount, currencyVal.asString (),
                                 route));
}

void
MoveProcessor::TryDeposit (const std::string& name, const Json::Value& cmd)
{
  if (cmd.isNull ())
    return;

  Amount amount;
  if (!AmountFromJson (cmd, amount))
    {
      LOG (WARNING) << "Invalid deposit by " << name << ": " << cmd;
      return;
    }

  LogFailure (name, "deposit", ops.DepositNative (name, amount));
}

void
MoveProcessor::TryStake (const std::string& name, const Json::Value& cmd)
{
  if (cmd.isNull ())
    return;

  Amount amount;
  if (!AmountFromJson (cmd, amount))
    {
      LOG (WARNING) << "Invalid stake by " << name << ": " << cmd;
      return;
    }

  LogFailure (name, "stake", ops.Stake (name, amount));
}

void
MoveProcessor::TryClaim (const std::string& name, const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  LogFailure (name, "claim", ops.ClaimRewards (name));
}

void
MoveProcessor::TryUnstake (const std::string& name, const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  LogFailure (name, "unstake", ops.Unstake (name));
}

void
MoveProcessor::TryLiquidityLock (const std::string& name,
                                 const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  LogFailure (name, "liquidity lock", ops.LockLiquidity (name));
}

void
MoveProcessor::TryCoinOperation (const std::string& name,
                                 const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  const auto& burn = cmd["b"];
  if (!burn.isNull ())
    {
      Amount amount;
      if (AmountFromJson (burn, amount))
        LogFailure (name, "burn", ops.BurnOwnTokens (name, amount));
      else
        LOG (WARNING) << "Invalid burn by " << name << ": " << burn;
    }

  const auto& transfers = cmd["t"];
  if (transfers.isNull ())
    return;
  if (!transfers.isObject ())
    {
      LOG (WARNING) << "Invalid transfers by " << name << ": " << transfers;
      return;
    }

  /* Member names of a JSON object are sorted, so the order in which
     the transfers are done is well-defined.  */
  for (const auto& to : transfers.getMemberNames ())
    {
      Amount amount;
      if (!AmountFromJson (transfers[to], amount))
        {
          LOG (WARNING)
              << "Invalid transfer from " << name << " to " << to
              << ": " << transfers[to];
          continue;
        }

      LogFailure (name, "transfer", ops.TransferTokens (name, to, amount));
    }
}

void
MoveProcessor::TryAdminOperations (const std::string& name,
                                   const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  VLOG (1) << "Admin operations by " << name << ": " << cmd;

  if (cmd["end"].isObject ())
    LogFailure (name, "end presale", ops.EndPresale (name));

  const auto& params = cmd["params"];
  if (!params.isNull ())
    {
      Amount apy, fee;
      if (params.isObject ()
            && AmountFromJson (params["apy"], apy)
            && AmountFromJson (params["fee"], fee))
        LogFailure (name, "update parameters",
                    ops.UpdateParameters (name, apy, fee));
      else
        LOG (WARNING) << "Invalid parameter update: " << params;
    }

  const auto& refill = cmd["refill"];
  if (!refill.isNull ())
    {
      Amount amount;
      if (AmountFromJson (refill, amount))
        LogFailure (name, "refill", ops.RefillRewardPool (name, amount));
      else
        LOG (WARNING) << "Invalid refill: " << refill;
    }

  const auto& liquidity = cmd["liquidity"];
  if (!liquidity.isNull ())
    {
      Amount amount;
      if (AmountFromJson (liquidity, amount))
        LogFailure (name, "provide liquidity",
                    ops.ProvideLiquidity (name, amount));
      else
        LOG (WARNING) << "Invalid liquidity: " << liquidity;
    }

  const auto& burn = cmd["burn"];
  if (!burn.isNull ())
    {
      Amount amount;
      if (burn.isObject () && burn["holding"].isString ()
            && AmountFromJson (burn["amount"], amount))
        LogFailure (name, "burn",
                    ops.BurnTokens (name, burn["holding"].asString (),
                                    amount));
      else
        LOG (WARNING) << "Invalid burn: " << burn;
    }

  const auto& withdraw = cmd["withdraw"];
  if (!withdraw.isNull ())
    {
      Amount amount;
      if (AmountFromJson (withdraw, amount))
        LogFailure (name, "withdraw", ops.WithdrawFunds (name, amount));
      else
        LOG (WARNING) << "Invalid withdrawal: " << withdraw;
    }

  const auto& stage = cmd["stage"];
  if (!stage.isNull ())
    {
      unsigned index;
      Amount price, sold, raised;
      if (stage.isObject ()
            && StageIndexFromJson (stage["index"], index)
            && AmountFromJson (stage["price"], price)
            && AmountFromJson (stage["sold"], sold)
            && AmountFromJson (stage["raised"], raised))
        LogFailure (name, "stage update",
                    ops.UpdatePresaleStage (name, index, price, sold, raised));
      else
        LOG (WARNING) << "Invalid stage update: " << stage;
    }
}

void
MoveProcessor::ProcessAdmin (const Json::Value& admArray)
{
  CHECK (admArray.isArray ());
  LOG (INFO) << "Processing " << admArray.size () << " admin commands...";

  for (const auto& cmd : admArray)
    {
      CHECK (cmd.isObject ());
      ProcessOneAdmin (cmd["cmd"]);
    }
}

void
MoveProcessor::ProcessOneAdmin (const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  HandleGodMode (cmd["god"]);
}

void
MoveProcessor::HandleGodMode (const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  if (!ctx.Params ().GodMode ())
    {
      LOG (WARNING) << "God mode command ignored: " << cmd;
      return;
    }

  const auto& mint = cmd["mint"];
  if (!mint.isArray ())
    return;

  for (const auto& entry : mint)
    {
      Amount amount;
      if (!entry.isObject ()
            || !entry["currency"].isString ()
            || !entry["holding"].isString ()
            || !AmountFromJson (entry["amount"], amount))
        {
          LOG (WARNING) << "Invalid god-mode mint: " << entry;
          continue;
        }

      const std::string currency = entry["currency"].asString ();
      const std::string holding = entry["holding"].asString ();
      LOG (INFO)
          << "Minting " << amount << " " << currency << " to " << holding;
      LogFailure ("god mode", "mint",
                  ops.GodMint (currency, holding, amount));
    }
}

} // namespace lpd
