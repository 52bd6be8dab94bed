// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_BATCHES_HPP
#define FHETRADE_BATCHES_HPP

#include "accesscontrol.hpp"
#include "context.hpp"
#include "events.hpp"
#include "globals.hpp"
#include "opresult.hpp"
#include "pausecontrol.hpp"

#include <cstdint>

namespace fhetrade
{

/**
 * The open/closed lifecycle of trading rounds.  Batch IDs start at zero
 * (meaning no batch has been opened yet) and are incremented on every
 * open.  Only the current batch can ever be open.
 */
class BatchLifecycle
{

private:

  GlobalState globals;
  const AccessControl& access;
  const PauseControl& pause;
  EventSink& events;

  void EmitBatchEvent (int64_t batch, bool open);

public:

  explicit BatchLifecycle (SQLiteDatabase& d, const AccessControl& a,
                           const PauseControl& p, EventSink& e)
    : globals(d), access(a), pause(p), events(e)
  {}

  BatchLifecycle () = delete;
  BatchLifecycle (const BatchLifecycle&) = delete;
  void operator= (const BatchLifecycle&) = delete;

  int64_t GetCurrentBatch () const;

  /**
   * Returns whether the current batch is open.
   */
  bool IsOpen () const;

  /**
   * Starts a new batch.  This is allowed also while the current batch is
   * still open, in which case the new one simply takes over.
   */
  OpResult OpenBatch (const CallContext& ctx);

  OpResult CloseBatch (const CallContext& ctx);

};

} // namespace fhetrade

#endif // FHETRADE_BATCHES_HPP
