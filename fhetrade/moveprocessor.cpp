// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "moveprocessor.hpp"

#include <fheutil/jsonutils.hpp>
#include <fheutil/uint256.hpp>

#include <glog/logging.h>

namespace fhetrade
{

namespace
{

/**
 * Checks if a JSON value is an empty object, as used for operations
 * without arguments.
 */
bool
IsEmptyObject (const Json::Value& val)
{
  return val.isObject () && val.empty ();
}

} // anonymous namespace

void
MoveProcessor::Report (const CallContext& ctx, const std::string& type,
                       const OpResult res)
{
  if (res == OpResult::OK)
    VLOG (1) << "Applied " << type << " operation of " << ctx.name;
  else
    LOG (WARNING)
        << "Rejected " << type << " operation of " << ctx.name
        << ": " << res;
}

void
MoveProcessor::HandleOperation (const CallContext& ctx, const Json::Value& mv)
{
  CHECK (mv.isObject ());
  if (mv.size () != 1)
    {
      LOG (WARNING) << "Invalid operation: " << mv;
      return;
    }

  if (mv.isMember ("owner"))
    HandleRoleChange (ctx, "owner", mv["owner"]);
  else if (mv.isMember ("addprovider"))
    HandleRoleChange (ctx, "addprovider", mv["addprovider"]);
  else if (mv.isMember ("removeprovider"))
    HandleRoleChange (ctx, "removeprovider", mv["removeprovider"]);
  else if (mv.isMember ("cooldown"))
    HandleCooldown (ctx, mv["cooldown"]);
  else if (mv.isMember ("pause"))
    HandlePause (ctx, true, mv["pause"]);
  else if (mv.isMember ("unpause"))
    HandlePause (ctx, false, mv["unpause"]);
  else if (mv.isMember ("open"))
    HandleBatch (ctx, true, mv["open"]);
  else if (mv.isMember ("close"))
    HandleBatch (ctx, false, mv["close"]);
  else if (mv.isMember ("news"))
    HandleNews (ctx, mv["news"]);
  else if (mv.isMember ("trade"))
    HandleTrade (ctx, mv["trade"]);
  else if (mv.isMember ("decrypt"))
    HandleDecrypt (ctx, mv["decrypt"]);
  else if (mv.isMember ("fulfil"))
    HandleFulfil (ctx, mv["fulfil"]);
  else
    LOG (WARNING) << "Invalid operation: " << mv;
}

void
MoveProcessor::HandleRoleChange (const CallContext& ctx,
                                 const std::string& type,
                                 const Json::Value& op)
{
  if (!op.isString () || op.asString ().empty ())
    {
      LOG (WARNING) << "Invalid account in " << type << " operation: " << op;
      return;
    }
  const std::string target = op.asString ();

  OpResult res;
  if (type == "owner")
    res = market.TransferOwnership (ctx, target);
  else if (type == "addprovider")
    res = market.AddProvider (ctx, target);
  else
    {
      CHECK_EQ (type, "removeprovider");
      res = market.RemoveProvider (ctx, target);
    }

  Report (ctx, type, res);
}

void
MoveProcessor::HandleCooldown (const CallContext& ctx, const Json::Value& op)
{
  if (!IsIntegerValue (op) || !op.isInt64 () || op.asInt64 () < 0)
    {
      LOG (WARNING) << "Invalid cooldown operation: " << op;
      return;
    }

  Report (ctx, "cooldown", market.SetCooldownSeconds (ctx, op.asInt64 ()));
}

void
MoveProcessor::HandlePause (const CallContext& ctx, const bool pause,
                            const Json::Value& op)
{
  if (!op.isBool () || !op.asBool ())
    {
      LOG (WARNING) << "Invalid pause/unpause operation: " << op;
      return;
    }

  if (pause)
    Report (ctx, "pause", market.Pause (ctx));
  else
    Report (ctx, "unpause", market.Unpause (ctx));
}

void
MoveProcessor::HandleBatch (const CallContext& ctx, const bool open,
                            const Json::Value& op)
{
  if (!IsEmptyObject (op))
    {
      LOG (WARNING) << "Invalid batch operation: " << op;
      return;
    }

  if (open)
    Report (ctx, "open", market.OpenBatch (ctx));
  else
    Report (ctx, "close", market.CloseBatch (ctx));
}

void
MoveProcessor::HandleNews (const CallContext& ctx, const Json::Value& op)
{
  uint256 handle;
  if (!Uint256FromJson (op, handle))
    {
      LOG (WARNING) << "Invalid handle in news operation: " << op;
      return;
    }

  Report (ctx, "news", market.SubmitNews (ctx, handle));
}

void
MoveProcessor::HandleTrade (const CallContext& ctx, const Json::Value& op)
{
  if (!op.isObject () || op.size () != 2)
    {
      LOG (WARNING) << "Invalid trade operation: " << op;
      return;
    }

  uint256 balance, holding;
  if (!Uint256FromJson (op["balance"], balance)
        || !Uint256FromJson (op["holding"], holding))
    {
      LOG (WARNING) << "Invalid handles in trade operation: " << op;
      return;
    }

  Report (ctx, "trade", market.SubmitTrade (ctx, balance, holding));
}

void
MoveProcessor::HandleDecrypt (const CallContext& ctx, const Json::Value& op)
{
  if (!IsEmptyObject (op))
    {
      LOG (WARNING) << "Invalid decrypt operation: " << op;
      return;
    }

  uint256 requestId;
  const OpResult res = market.RequestBatchDecryption (ctx, requestId);
  if (res == OpResult::OK)
    LOG (INFO)
        << "Decryption by " << ctx.name << " got request ID "
        << requestId.ToHex ();
  Report (ctx, "decrypt", res);
}

void
MoveProcessor::HandleFulfil (const CallContext& ctx, const Json::Value& op)
{
  if (!op.isObject () || op.size () != 3)
    {
      LOG (WARNING) << "Invalid fulfil operation: " << op;
      return;
    }

  uint256 requestId;
  if (!Uint256FromJson (op["id"], requestId))
    {
      LOG (WARNING) << "Invalid request ID in fulfil operation: " << op;
      return;
    }

  std::string cleartexts, proof;
  if (!BytesFromJson (op["cleartexts"], cleartexts)
        || !BytesFromJson (op["proof"], proof))
    {
      LOG (WARNING) << "Invalid data in fulfil operation: " << op;
      return;
    }

  Report (ctx, "fulfil",
          market.FulfilDecryption (requestId, cleartexts, proof));
}

void
MoveProcessor::ProcessOne (const int64_t timestamp, const Json::Value& obj)
{
  if (!obj.isObject ())
    {
      LOG (WARNING) << "Invalid move entry: " << obj;
      return;
    }

  const auto& nameVal = obj["name"];
  if (!nameVal.isString () || nameVal.asString ().empty ())
    {
      LOG (WARNING) << "Invalid name in move entry: " << obj;
      return;
    }

  CallContext ctx;
  ctx.name = nameVal.asString ();
  ctx.timestamp = timestamp;

  const auto& mv = obj["move"];

  if (mv.isObject ())
    HandleOperation (ctx, mv);
  else if (mv.isArray ())
    {
      for (const auto& op : mv)
        {
          if (op.isObject ())
            HandleOperation (ctx, op);
          else
            LOG (WARNING) << "Invalid operation inside array move: " << op;
        }
    }
  else
    LOG (WARNING) << "Invalid move: " << mv;
}

bool
MoveProcessor::ProcessBlock (const Json::Value& block)
{
  if (!block.isObject ())
    {
      LOG (WARNING) << "Invalid block: " << block;
      return false;
    }

  const auto& timestampVal = block["timestamp"];
  if (!IsIntegerValue (timestampVal) || !timestampVal.isInt64 ()
        || timestampVal.asInt64 () < 0)
    {
      LOG (WARNING) << "Invalid timestamp in block: " << block;
      return false;
    }
  const int64_t timestamp = timestampVal.asInt64 ();

  const auto& moves = block["moves"];
  if (!moves.isArray ())
    {
      LOG (WARNING) << "Invalid moves in block: " << block;
      return false;
    }

  VLOG (1)
      << "Processing block at time " << timestamp
      << " with " << moves.size () << " moves";

  for (const auto& mv : moves)
    ProcessOne (timestamp, mv);

  return true;
}

} // namespace fhetrade
