// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "slotstore.hpp"

#include <glog/logging.h>

namespace fhetrade
{

SlotSet
EncryptedStateStore::GetSlots (const int64_t batch) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `slot`, `handle`
      FROM `slots`
      WHERE `batch` = ?1
  )");
  stmt.Bind (1, batch);

  SlotSet res;
  while (stmt.Step ())
    {
      const int slot = stmt.Get<int> (0);
      CHECK (slot >= 0 && static_cast<size_t> (slot) < NUM_SLOTS)
          << "Invalid slot " << slot << " in batch " << batch;
      res[slot] = CiphertextSlot (stmt.Get<uint256> (1));
    }

  return res;
}

void
EncryptedStateStore::SetSlot (const int64_t batch, const Slot s,
                              const uint256& handle)
{
  VLOG (1)
      << "Setting " << SlotToString (s) << " of batch " << batch
      << " to " << handle.ToHex ();

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `slots`
      (`batch`, `slot`, `handle`)
      VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, batch);
  stmt.Bind (2, static_cast<int> (s));
  stmt.Bind (3, handle);
  stmt.Execute ();
}

OpResult
EncryptedStateStore::CheckSubmission (const CallContext& ctx) const
{
  if (pause.IsPaused ())
    return OpResult::SYSTEM_PAUSED;

  const OpResult res
      = cooldown.Check (ctx.name, ActionCategory::SUBMISSION, ctx.timestamp);
  if (res != OpResult::OK)
    return res;

  if (!batches.IsOpen ())
    return OpResult::BATCH_NOT_OPEN;

  return OpResult::OK;
}

OpResult
EncryptedStateStore::SubmitNews (const CallContext& ctx, const uint256& handle)
{
  if (!access.IsProvider (ctx.name))
    return OpResult::PERMISSION_DENIED;

  const OpResult res = CheckSubmission (ctx);
  if (res != OpResult::OK)
    return res;

  const int64_t batch = batches.GetCurrentBatch ();
  SetSlot (batch, Slot::NEWS_IMPACT, handle);
  cooldown.Record (ctx.name, ActionCategory::SUBMISSION, ctx.timestamp);

  LOG (INFO) << "News submitted by " << ctx.name << " for batch " << batch;

  Json::Value data(Json::objectValue);
  data["batch"] = static_cast<Json::Int64> (batch);
  data["submitter"] = ctx.name;
  events.Emit ("news", data);

  return OpResult::OK;
}

OpResult
EncryptedStateStore::SubmitTrade (const CallContext& ctx,
                                  const uint256& balance,
                                  const uint256& holding)
{
  const OpResult res = CheckSubmission (ctx);
  if (res != OpResult::OK)
    return res;

  const int64_t batch = batches.GetCurrentBatch ();
  SetSlot (batch, Slot::PLAYER_BALANCE, balance);
  SetSlot (batch, Slot::PLAYER_STOCK_HOLDING, holding);
  cooldown.Record (ctx.name, ActionCategory::SUBMISSION, ctx.timestamp);

  LOG (INFO) << "Trade submitted by " << ctx.name << " for batch " << batch;

  Json::Value data(Json::objectValue);
  data["batch"] = static_cast<Json::Int64> (batch);
  data["trader"] = ctx.name;
  events.Emit ("trade", data);

  return OpResult::OK;
}

} // namespace fhetrade
