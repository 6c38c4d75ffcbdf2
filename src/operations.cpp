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

#include "operations.hpp"

#include "adminops.hpp"
#include "liquidity.hpp"
#include "presale.hpp"
#include "rewards.hpp"
#include "staking.hpp"
#include "transfers.hpp"
#include "unstake.hpp"

#include <glog/logging.h>

namespace lpd
{

Operations::Operations (Database& d, Ledger& l, const Context& c)
  : db(d), ledger(l), ctx(c),
    auth(MakeAuthorisationPolicy (db, ctx.Params ()))
{}

template <typename Fcn>
  OpStatus
  Operations::RunAtomically (const std::string& op, const Fcn& fcn)
{
  Database::Savepoint sp(db, "operation");

  /* The function must not keep any database handles alive beyond its
     return, so that everything is written before we commit or roll back.  */
  const OpStatus res = fcn ();

  if (res.IsOk ())
    {
      VLOG (1) << "Operation " << op << " succeeded";
      sp.Commit ();
    }
  else
    VLOG (1) << "Operation " << op << " failed, rolling back: " << res;

  return res;
}

OpStatus
Operations::InitialisePresale (const std::string& caller)
{
  return RunAtomically ("initialise presale", [&] ()
    {
      PresaleController presale(db, *auth, ctx);
      return presale.Initialise (caller);
    });
}

OpStatus
Operations::InitialiseGlobalState (const std::string& caller, const Amount apy,
                                   const Amount feePercent)
{
  return RunAtomically ("initialise global state", [&] ()
    {
      if (!auth->IsAuthorised (caller))
        return OpStatus (ErrorCode::UNAUTHORIZED,
                         caller
                           + " is not allowed to initialise global state");

      StakingEngine staking(db, ledger, ctx);
      return staking.InitialiseGlobalState (apy, feePercent);
    });
}

OpStatus
Operations::InitialiseStageTable (const std::string& caller)
{
  return RunAtomically ("initialise stages", [&] ()
    {
      AdminOps admin(db, ledger, *auth, ctx);
      return admin.InitialiseStageTable (caller);
    });
}

OpStatus
Operations::EndPresale (const std::string& caller)
{
  return RunAtomically ("end presale", [&] ()
    {
      PresaleController presale(db, *auth, ctx);
      return presale.End (caller);
    });
}

OpStatus
Operations::AcceptPayment (const std::string& caller, const Amount amount,
                           const std::string& currency,
                           const PaymentRoute& route)
{
  return RunAtomically ("payment", [&] ()
    {
      PaymentProcessor payments(db, ledger, ctx);
      return payments.AcceptPayment (caller, amount, currency, route);
    });
}

OpStatus
Operations::DepositNative (const std::string& caller, const Amount amount)
{
  return RunAtomically ("deposit", [&] ()
    {
      PaymentProcessor payments(db, ledger, ctx);
      return payments.DepositNative (caller, amount);
    });
}

OpStatus
Operations::Stake (const std::string& caller, const Amount amount)
{
  return RunAtomically ("stake", [&] ()
    {
      StakingEngine staking(db, ledger, ctx);
      return staking.Stake (caller, amount);
    });
}

OpStatus
Operations::Unstake (const std::string& caller)
{
  return RunAtomically ("unstake", [&] ()
    {
      UnstakeEngine unstake(db, ledger, ctx);
      return unstake.Unstake (caller);
    });
}

OpStatus
Operations::ClaimRewards (const std::string& caller)
{
  return RunAtomically ("claim", [&] ()
    {
      RewardCalculator rewards(db, ledger, ctx);
      return rewards.Claim (caller);
    });
}

OpStatus
Operations::CalculateRewards (const std::string& caller, Amount& reward)
{
  RewardCalculator rewards(db, ledger, ctx);
  return rewards.Calculate (caller, reward);
}

OpStatus
Operations::LockLiquidity (const std::string& caller)
{
  return RunAtomically ("lock liquidity", [&] ()
    {
      LiquidityLock lock(db, ledger, ctx);
      return lock.Lock (caller);
    });
}

OpStatus
Operations::TransferTokens (const std::string& caller,
                            const std::string& recipient, const Amount amount)
{
  return RunAtomically ("transfer", [&] ()
    {
      TokenTransfers transfers(ledger, ctx);
      return transfers.Transfer (caller, recipient, amount);
    });
}

OpStatus
Operations::BurnOwnTokens (const std::string& caller, const Amount amount)
{
  return RunAtomically ("burn own", [&] ()
    {
      TokenTransfers transfers(ledger, ctx);
      return transfers.Burn (caller, amount);
    });
}

OpStatus
Operations::BurnTokens (const std::string& caller, const std::string& holding,
                        const Amount amount)
{
  return RunAtomically ("burn", [&] ()
    {
      AdminOps admin(db, ledger, *auth, ctx);
      return admin.BurnTokens (caller, holding, amount);
    });
}

OpStatus
Operations::RefillRewardPool (const std::string& caller, const Amount amount)
{
  return RunAtomically ("refill", [&] ()
    {
      AdminOps admin(db, ledger, *auth, ctx);
      return admin.RefillRewardPool (caller, amount);
    });
}

OpStatus
Operations::ProvideLiquidity (const std::string& caller, const Amount amount)
{
  return RunAtomically ("provide liquidity", [&] ()
    {
      AdminOps admin(db, ledger, *auth, ctx);
      return admin.ProvideLiquidity (caller, amount);
    });
}

OpStatus
Operations::UpdateParameters (const std::string& caller, const Amount apy,
                              const Amount feePercent)
{
  return RunAtomically ("update parameters", [&] ()
    {
      AdminOps admin(db, ledger, *auth, ctx);
      return admin.UpdateParameters (caller, apy, feePercent);
    });
}

OpStatus
Operations::WithdrawFunds (const std::string& caller, const Amount amount)
{
  return RunAtomically ("withdraw", [&] ()
    {
      AdminOps admin(db, ledger, *auth, ctx);
      return admin.WithdrawFunds (caller, amount);
    });
}

OpStatus
Operations::UpdatePresaleStage (const std::string& caller,
                                const unsigned index, const Amount price,
                                const Amount tokensSold,
                                const Amount totalRaised)
{
  return RunAtomically ("update stage", [&] ()
    {
      AdminOps admin(db, ledger, *auth, ctx);
      return admin.UpdatePresaleStage (caller, index, price,
                                       tokensSold, totalRaised);
    });
}

OpStatus
Operations::CreditFromChain (const std::string& caller, const Amount amount)
{
  return RunAtomically ("credit", [&] ()
    {
      PaymentProcessor payments(db, ledger, ctx);
      return payments.CreditFromChain (caller, amount);
    });
}

OpStatus
Operations::GodMint (const std::string& currency, const std::string& holding,
                     const Amount amount)
{
  CHECK (ctx.Params ().GodMode ()) << "God mode is not enabled";
  return RunAtomically ("god mint", [&] ()
    {
      return ledger.Mint (currency, holding, amount);
    });
}

} // namespace lpd
