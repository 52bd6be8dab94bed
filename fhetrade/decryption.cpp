// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "decryption.hpp"

#include <fheutil/jsonutils.hpp>

#include <glog/logging.h>

namespace fhetrade
{

Json::Value
DecryptionContext::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["id"] = requestId.ToHex ();
  res["batch"] = static_cast<Json::Int64> (batch);
  res["statehash"] = stateHash.ToHex ();
  res["processed"] = processed;

  return res;
}

namespace
{

/**
 * Reads a decryption context from the current row of a statement
 * that selects `id`, `batch`, `statehash` and `processed`.
 */
DecryptionContext
ContextFromRow (const SQLiteDatabase::Statement& stmt)
{
  DecryptionContext res;
  res.requestId = stmt.Get<uint256> (0);
  res.batch = stmt.Get<int64_t> (1);
  res.stateHash = stmt.Get<uint256> (2);
  res.processed = stmt.Get<bool> (3);

  return res;
}

} // anonymous namespace

bool
DecryptionRequestManager::GetContext (const uint256& requestId,
                                      DecryptionContext& ctx) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `id`, `batch`, `statehash`, `processed`
      FROM `decryptions`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, requestId);

  if (!stmt.Step ())
    return false;

  ctx = ContextFromRow (stmt);
  CHECK (!stmt.Step ());

  return true;
}

std::vector<DecryptionContext>
DecryptionRequestManager::GetPending () const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `id`, `batch`, `statehash`, `processed`
      FROM `decryptions`
      WHERE NOT `processed`
      ORDER BY `id`
  )");

  std::vector<DecryptionContext> res;
  while (stmt.Step ())
    res.push_back (ContextFromRow (stmt));

  return res;
}

void
DecryptionRequestManager::MarkProcessed (const uint256& requestId)
{
  auto stmt = db.Prepare (R"(
    UPDATE `decryptions`
      SET `processed` = 1
      WHERE `id` = ?1
  )");
  stmt.Bind (1, requestId);
  stmt.Execute ();

  CHECK_EQ (sqlite3_changes (*db), 1)
      << "Failed to mark request " << requestId.ToHex () << " as processed";
}

OpResult
DecryptionRequestManager::RequestBatchDecryption (const CallContext& ctx,
                                                  uint256& requestId)
{
  if (pause.IsPaused ())
    return OpResult::SYSTEM_PAUSED;

  const OpResult res = cooldown.Check (
      ctx.name, ActionCategory::DECRYPTION_REQUEST, ctx.timestamp);
  if (res != OpResult::OK)
    return res;

  if (!batches.IsOpen ())
    return OpResult::BATCH_NOT_OPEN;

  const int64_t batch = batches.GetCurrentBatch ();
  const SlotSet slots = store.GetSlots (batch);
  const uint256 stateHash = ComputeStateHash (slots, globals.GetContractId ());

  std::vector<uint256> handles;
  for (const auto& s : slots)
    {
      if (s.IsSet ())
        handles.push_back (s.GetHandle ());
      else
        {
          uint256 nullHandle;
          nullHandle.SetNull ();
          handles.push_back (nullHandle);
        }
    }

  requestId = oracle.RequestDecryption (handles, CALLBACK);

  DecryptionContext existing;
  CHECK (!GetContext (requestId, existing))
      << "Oracle reused request ID " << requestId.ToHex ();

  auto stmt = db.Prepare (R"(
    INSERT INTO `decryptions`
      (`id`, `batch`, `statehash`, `processed`)
      VALUES (?1, ?2, ?3, 0)
  )");
  stmt.Bind (1, requestId);
  stmt.Bind (2, batch);
  stmt.Bind (3, stateHash);
  stmt.Execute ();

  cooldown.Record (ctx.name, ActionCategory::DECRYPTION_REQUEST,
                   ctx.timestamp);

  LOG (INFO)
      << ctx.name << " requested decryption of batch " << batch
      << " with ID " << requestId.ToHex ();

  Json::Value data(Json::objectValue);
  data["id"] = requestId.ToHex ();
  data["batch"] = static_cast<Json::Int64> (batch);
  events.Emit ("decryptionrequested", data);

  return OpResult::OK;
}

OpResult
DecryptionRequestManager::FulfilDecryption (const uint256& requestId,
                                            const std::string& cleartexts,
                                            const std::string& proof)
{
  DecryptionContext ctx;
  if (!GetContext (requestId, ctx))
    return OpResult::UNKNOWN_REQUEST;

  if (ctx.processed)
    return OpResult::REPLAY_ATTEMPT;

  const SlotSet slots = store.GetSlots (ctx.batch);
  const uint256 currentHash
      = ComputeStateHash (slots, globals.GetContractId ());
  if (currentHash != ctx.stateHash)
    {
      LOG (WARNING)
          << "Slots of batch " << ctx.batch << " changed since request "
          << requestId.ToHex () << " was made";
      return OpResult::STATE_MISMATCH;
    }

  if (!oracle.VerifyProof (requestId, cleartexts, proof))
    return OpResult::INVALID_PROOF;

  PlaintextValues values;
  if (!DecodeCleartexts (cleartexts, values))
    return OpResult::MALFORMED_CLEARTEXT;

  MarkProcessed (requestId);

  LOG (INFO)
      << "Fulfilled decryption request " << requestId.ToHex ()
      << " for batch " << ctx.batch;

  Json::Value data(Json::objectValue);
  data["id"] = requestId.ToHex ();
  data["batch"] = static_cast<Json::Int64> (ctx.batch);
  for (const auto s : ALL_SLOTS)
    data[SlotToString (s)] = PlaintextToJson (values[static_cast<int> (s)]);
  events.Emit ("decryptioncompleted", data);

  return OpResult::OK;
}

} // namespace fhetrade
