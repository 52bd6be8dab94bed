// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "market.hpp"

#include "schema.hpp"

#include <glog/logging.h>

namespace fhetrade
{

Market::Market (SQLiteDatabase& d, DecryptionOracle& oracle,
                EventSink& events)
  : db(d), globals(d),
    access(d, events),
    pause(d, access, events),
    cooldown(d, access, events),
    batches(d, access, pause, events),
    store(d, access, pause, cooldown, batches, events),
    decryption(d, pause, cooldown, batches, store, oracle, events)
{
  SetupDatabaseSchema (db);
}

template <typename Fcn>
  OpResult
  Market::RunOperation (const std::string& op, const Fcn& fcn)
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (globals.IsInitialised ()) << "Market has not been initialised";

  ActiveTransaction tx(db);
  const OpResult res = fcn ();

  if (res == OpResult::OK)
    {
      VLOG (1) << "Operation " << op << " succeeded";
      tx.SetSuccess ();
    }
  else
    LOG (WARNING) << "Operation " << op << " failed: " << res;

  return res;
}

void
Market::Initialise (const std::string& owner, const uint256& contract)
{
  std::lock_guard<std::mutex> lock(mut);

  if (globals.IsInitialised ())
    {
      LOG (INFO) << "Using existing state, owned by " << access.GetOwner ();
      return;
    }

  ActiveTransaction tx(db);
  globals.Initialise (owner, contract);
  tx.SetSuccess ();
}

bool
Market::IsInitialised () const
{
  std::lock_guard<std::mutex> lock(mut);
  return globals.IsInitialised ();
}

OpResult
Market::TransferOwnership (const CallContext& ctx, const std::string& newOwner)
{
  return RunOperation ("transferownership", [&] ()
    {
      return access.TransferOwnership (ctx, newOwner);
    });
}

OpResult
Market::AddProvider (const CallContext& ctx, const std::string& name)
{
  return RunOperation ("addprovider", [&] ()
    {
      return access.AddProvider (ctx, name);
    });
}

OpResult
Market::RemoveProvider (const CallContext& ctx, const std::string& name)
{
  return RunOperation ("removeprovider", [&] ()
    {
      return access.RemoveProvider (ctx, name);
    });
}

OpResult
Market::SetCooldownSeconds (const CallContext& ctx, const int64_t seconds)
{
  return RunOperation ("setcooldown", [&] ()
    {
      return cooldown.SetCooldownSeconds (ctx, seconds);
    });
}

OpResult
Market::Pause (const CallContext& ctx)
{
  return RunOperation ("pause", [&] ()
    {
      return pause.Pause (ctx);
    });
}

OpResult
Market::Unpause (const CallContext& ctx)
{
  return RunOperation ("unpause", [&] ()
    {
      return pause.Unpause (ctx);
    });
}

OpResult
Market::OpenBatch (const CallContext& ctx)
{
  return RunOperation ("openbatch", [&] ()
    {
      return batches.OpenBatch (ctx);
    });
}

OpResult
Market::CloseBatch (const CallContext& ctx)
{
  return RunOperation ("closebatch", [&] ()
    {
      return batches.CloseBatch (ctx);
    });
}

OpResult
Market::SubmitNews (const CallContext& ctx, const uint256& handle)
{
  return RunOperation ("submitnews", [&] ()
    {
      return store.SubmitNews (ctx, handle);
    });
}

OpResult
Market::SubmitTrade (const CallContext& ctx, const uint256& balance,
                     const uint256& holding)
{
  return RunOperation ("submittrade", [&] ()
    {
      return store.SubmitTrade (ctx, balance, holding);
    });
}

OpResult
Market::RequestBatchDecryption (const CallContext& ctx, uint256& requestId)
{
  return RunOperation ("requestdecryption", [&] ()
    {
      return decryption.RequestBatchDecryption (ctx, requestId);
    });
}

OpResult
Market::FulfilDecryption (const uint256& requestId,
                          const std::string& cleartexts,
                          const std::string& proof)
{
  return RunOperation ("fulfildecryption", [&] ()
    {
      return decryption.FulfilDecryption (requestId, cleartexts, proof);
    });
}

Json::Value
Market::ReadState (const StateCallback& cb) const
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (globals.IsInitialised ()) << "Market has not been initialised";

  StateJsonExtractor ext(*this);
  return cb (ext);
}

} // namespace fhetrade
