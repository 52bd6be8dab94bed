// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_MARKET_HPP
#define FHETRADE_MARKET_HPP

#include "accesscontrol.hpp"
#include "batches.hpp"
#include "context.hpp"
#include "cooldown.hpp"
#include "database.hpp"
#include "decryption.hpp"
#include "events.hpp"
#include "globals.hpp"
#include "opresult.hpp"
#include "oracle.hpp"
#include "pausecontrol.hpp"
#include "slotstore.hpp"
#include "statejson.hpp"

#include <fheutil/uint256.hpp>

#include <json/json.h>

#include <functional>
#include <mutex>
#include <string>

namespace fhetrade
{

/**
 * The entry point to the trading core.  It ties the individual components
 * together over a shared database and runs each operation atomically:
 * operations are serialised with each other and with state reads, and a
 * failed operation leaves no trace in the database.
 */
class Market
{

private:

  SQLiteDatabase& db;
  GlobalState globals;

  AccessControl access;
  PauseControl pause;
  CooldownThrottle cooldown;
  BatchLifecycle batches;
  EncryptedStateStore store;
  DecryptionRequestManager decryption;

  /** Lock serialising all operations and reads.  */
  mutable std::mutex mut;

  /**
   * Executes the given function (returning an OpResult) inside a
   * database transaction, which is committed only if the result is OK.
   */
  template <typename Fcn>
    OpResult RunOperation (const std::string& op, const Fcn& fcn);

  friend class StateJsonExtractor;

public:

  /**
   * Type for a callback that extracts custom JSON from the state
   * (through a StateJsonExtractor instance).
   */
  using StateCallback
      = std::function<Json::Value (const StateJsonExtractor& ext)>;

  /**
   * Constructs the market on top of the given database.  The schema
   * is set up if needed.
   */
  explicit Market (SQLiteDatabase& d, DecryptionOracle& oracle,
                   EventSink& events);

  Market () = delete;
  Market (const Market&) = delete;
  void operator= (const Market&) = delete;

  /**
   * Seeds the state with an initial owner and contract identity if this has
   * not been done yet.  If the database is already initialised, the stored
   * values are kept and the arguments are ignored.
   */
  void Initialise (const std::string& owner, const uint256& contract);

  bool IsInitialised () const;

  OpResult TransferOwnership (const CallContext& ctx,
                              const std::string& newOwner);
  OpResult AddProvider (const CallContext& ctx, const std::string& name);
  OpResult RemoveProvider (const CallContext& ctx, const std::string& name);
  OpResult SetCooldownSeconds (const CallContext& ctx, int64_t seconds);

  OpResult Pause (const CallContext& ctx);
  OpResult Unpause (const CallContext& ctx);

  OpResult OpenBatch (const CallContext& ctx);
  OpResult CloseBatch (const CallContext& ctx);

  OpResult SubmitNews (const CallContext& ctx, const uint256& handle);
  OpResult SubmitTrade (const CallContext& ctx, const uint256& balance,
                        const uint256& holding);

  /**
   * Requests decryption of the current batch.  The ID of the request
   * is returned in requestId on success.
   */
  OpResult RequestBatchDecryption (const CallContext& ctx,
                                   uint256& requestId);

  /**
   * The callback through which the oracle delivers decryption results.
   */
  OpResult FulfilDecryption (const uint256& requestId,
                             const std::string& cleartexts,
                             const std::string& proof);

  /**
   * Extracts some JSON data from the current state through the given
   * callback, while holding the lock.
   */
  Json::Value ReadState (const StateCallback& cb) const;

};

} // namespace fhetrade

#endif // FHETRADE_MARKET_HPP
