// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "statejson.hpp"

#include "market.hpp"

namespace fhetrade
{

namespace
{

/**
 * Returns the last action time of an account as JSON, or null if
 * there was none.
 */
Json::Value
LastActionToJson (const CooldownThrottle& cooldown, const std::string& name,
                  const ActionCategory cat)
{
  int64_t timestamp;
  if (!cooldown.GetLastAction (name, cat, timestamp))
    return Json::Value ();

  return static_cast<Json::Int64> (timestamp);
}

} // anonymous namespace

Json::Value
StateJsonExtractor::GetRoles () const
{
  Json::Value res(Json::objectValue);
  res["owner"] = market.access.GetOwner ();

  Json::Value providers(Json::arrayValue);
  for (const auto& p : market.access.GetProviders ())
    providers.append (p);
  res["providers"] = providers;

  return res;
}

bool
StateJsonExtractor::IsAvailable () const
{
  return !market.pause.IsPaused ();
}

Json::Value
StateJsonExtractor::GetBatch () const
{
  Json::Value res(Json::objectValue);
  res["id"] = static_cast<Json::Int64> (market.batches.GetCurrentBatch ());
  res["open"] = market.batches.IsOpen ();

  return res;
}

Json::Value
StateJsonExtractor::GetSlots (const int64_t batch) const
{
  const SlotSet slots = market.store.GetSlots (batch);

  Json::Value slotsJson(Json::objectValue);
  for (const auto s : ALL_SLOTS)
    slotsJson[SlotToString (s)] = slots[static_cast<int> (s)].ToJson ();

  const uint256 hash
      = ComputeStateHash (slots, market.globals.GetContractId ());

  Json::Value res(Json::objectValue);
  res["batch"] = static_cast<Json::Int64> (batch);
  res["slots"] = slotsJson;
  res["statehash"] = hash.ToHex ();

  return res;
}

Json::Value
StateJsonExtractor::GetDecryption (const uint256& requestId) const
{
  DecryptionContext ctx;
  if (!market.decryption.GetContext (requestId, ctx))
    return Json::Value ();

  return ctx.ToJson ();
}

Json::Value
StateJsonExtractor::GetAccount (const std::string& name) const
{
  Json::Value res(Json::objectValue);
  res["name"] = name;
  res["owner"] = market.access.IsOwner (name);
  res["provider"] = market.access.IsProvider (name);

  Json::Value last(Json::objectValue);
  last["submission"]
      = LastActionToJson (market.cooldown, name, ActionCategory::SUBMISSION);
  last["decryptionrequest"]
      = LastActionToJson (market.cooldown, name,
                          ActionCategory::DECRYPTION_REQUEST);
  res["lastaction"] = last;

  return res;
}

Json::Value
StateJsonExtractor::FullState () const
{
  Json::Value res(Json::objectValue);
  res["roles"] = GetRoles ();
  res["paused"] = market.pause.IsPaused ();
  res["available"] = IsAvailable ();
  res["cooldown"]
      = static_cast<Json::Int64> (market.cooldown.GetCooldownSeconds ());
  res["contract"] = market.globals.GetContractId ().ToHex ();

  const Json::Value batch = GetBatch ();
  res["batch"] = batch;
  res["slots"] = GetSlots (batch["id"].asInt64 ())["slots"];

  Json::Value pending(Json::arrayValue);
  for (const auto& ctx : market.decryption.GetPending ())
    pending.append (ctx.ToJson ());
  res["pending"] = pending;

  return res;
}

} // namespace fhetrade
