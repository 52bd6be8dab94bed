// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "batches.hpp"

#include <glog/logging.h>

namespace fhetrade
{

int64_t
BatchLifecycle::GetCurrentBatch () const
{
  return globals.Get<int64_t> ("batch");
}

bool
BatchLifecycle::IsOpen () const
{
  return globals.Get<bool> ("open");
}

void
BatchLifecycle::EmitBatchEvent (const int64_t batch, const bool open)
{
  Json::Value data(Json::objectValue);
  data["batch"] = static_cast<Json::Int64> (batch);
  data["open"] = open;
  events.Emit ("batch", data);
}

OpResult
BatchLifecycle::OpenBatch (const CallContext& ctx)
{
  if (!access.IsOwner (ctx.name))
    return OpResult::PERMISSION_DENIED;
  if (pause.IsPaused ())
    return OpResult::SYSTEM_PAUSED;

  const int64_t previous = GetCurrentBatch ();
  if (IsOpen ())
    LOG (INFO) << "Batch " << previous << " is superseded while still open";

  const int64_t batch = previous + 1;
  CHECK_GT (batch, previous);
  globals.Set<int64_t> ("batch", batch);
  globals.Set<bool> ("open", true);

  LOG (INFO) << "Opened batch " << batch;
  EmitBatchEvent (batch, true);

  return OpResult::OK;
}

OpResult
BatchLifecycle::CloseBatch (const CallContext& ctx)
{
  if (!access.IsOwner (ctx.name))
    return OpResult::PERMISSION_DENIED;
  if (pause.IsPaused ())
    return OpResult::SYSTEM_PAUSED;
  if (!IsOpen ())
    return OpResult::BATCH_NOT_OPEN;

  const int64_t batch = GetCurrentBatch ();
  globals.Set<bool> ("open", false);

  LOG (INFO) << "Closed batch " << batch;
  EmitBatchEvent (batch, false);

  return OpResult::OK;
}

} // namespace fhetrade
