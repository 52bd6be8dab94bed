// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pausecontrol.hpp"

#include <glog/logging.h>

namespace fhetrade
{

bool
PauseControl::IsPaused () const
{
  return globals.Get<bool> ("paused");
}

void
PauseControl::SetPaused (const CallContext& ctx, const bool paused)
{
  globals.Set<bool> ("paused", paused);
  LOG (INFO)
      << "System " << (paused ? "paused" : "unpaused") << " by " << ctx.name;

  Json::Value data(Json::objectValue);
  data["paused"] = paused;
  data["by"] = ctx.name;
  events.Emit ("pause", data);
}

OpResult
PauseControl::Pause (const CallContext& ctx)
{
  if (!access.IsOwner (ctx.name))
    return OpResult::PERMISSION_DENIED;
  if (IsPaused ())
    return OpResult::ALREADY_PAUSED;

  SetPaused (ctx, true);
  return OpResult::OK;
}

OpResult
PauseControl::Unpause (const CallContext& ctx)
{
  if (!access.IsOwner (ctx.name))
    return OpResult::PERMISSION_DENIED;
  if (!IsPaused ())
    return OpResult::ALREADY_UNPAUSED;

  SetPaused (ctx, false);
  return OpResult::OK;
}

} // namespace fhetrade
