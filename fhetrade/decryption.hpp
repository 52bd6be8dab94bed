// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_DECRYPTION_HPP
#define FHETRADE_DECRYPTION_HPP

#include "batches.hpp"
#include "context.hpp"
#include "cooldown.hpp"
#include "database.hpp"
#include "events.hpp"
#include "globals.hpp"
#include "opresult.hpp"
#include "oracle.hpp"
#include "pausecontrol.hpp"
#include "slotstore.hpp"

#include <fheutil/uint256.hpp>

#include <json/json.h>

#include <cstdint>
#include <string>
#include <vector>

namespace fhetrade
{

/**
 * The bookkeeping for one decryption request to the oracle.
 */
struct DecryptionContext
{

  /** The ID assigned by the oracle.  */
  uint256 requestId;

  /** The batch whose slots were requested.  */
  int64_t batch;

  /** Commitment to the slots at the time of the request.  */
  uint256 stateHash;

  /** Whether the request has been fulfilled already.  */
  bool processed;

  Json::Value ToJson () const;

};

/**
 * Handles the two-phase decryption protocol:  A request snapshots a
 * commitment to the current batch's slots and hands the handles to the
 * oracle.  The oracle's later fulfilment is accepted only once, only if
 * the slots still match the commitment, and only with a valid proof.
 */
class DecryptionRequestManager
{

private:

  SQLiteDatabase& db;
  GlobalState globals;

  const PauseControl& pause;
  CooldownThrottle& cooldown;
  const BatchLifecycle& batches;
  const EncryptedStateStore& store;
  DecryptionOracle& oracle;
  EventSink& events;

  /**
   * Marks a request as fulfilled.
   */
  void MarkProcessed (const uint256& requestId);

public:

  /** Callback identifier passed to the oracle with every request.  */
  static constexpr const char* CALLBACK = "fulfildecryption";

  explicit DecryptionRequestManager (SQLiteDatabase& d, const PauseControl& p,
                                     CooldownThrottle& c,
                                     const BatchLifecycle& b,
                                     const EncryptedStateStore& s,
                                     DecryptionOracle& o, EventSink& e)
    : db(d), globals(d),
      pause(p), cooldown(c), batches(b), store(s), oracle(o), events(e)
  {}

  DecryptionRequestManager () = delete;
  DecryptionRequestManager (const DecryptionRequestManager&) = delete;
  void operator= (const DecryptionRequestManager&) = delete;

  /**
   * Requests decryption of the current batch's slots.  On success,
   * the ID assigned by the oracle is returned in requestId.
   */
  OpResult RequestBatchDecryption (const CallContext& ctx, uint256& requestId);

  /**
   * Processes the oracle's answer to a request.  This is not subject to
   * any caller restrictions, since the proof authenticates the data.
   */
  OpResult FulfilDecryption (const uint256& requestId,
                             const std::string& cleartexts,
                             const std::string& proof);

  /**
   * Looks up the context of a request.  Returns false if there is none.
   */
  bool GetContext (const uint256& requestId, DecryptionContext& ctx) const;

  /**
   * Returns the contexts of all requests that have not been fulfilled yet,
   * ordered by ID.
   */
  std::vector<DecryptionContext> GetPending () const;

};

} // namespace fhetrade

#endif // FHETRADE_DECRYPTION_HPP
