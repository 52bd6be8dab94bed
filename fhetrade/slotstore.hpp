// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_SLOTSTORE_HPP
#define FHETRADE_SLOTSTORE_HPP

#include "accesscontrol.hpp"
#include "batches.hpp"
#include "context.hpp"
#include "cooldown.hpp"
#include "database.hpp"
#include "events.hpp"
#include "opresult.hpp"
#include "pausecontrol.hpp"
#include "slots.hpp"

#include <fheutil/uint256.hpp>

#include <cstdint>

namespace fhetrade
{

/**
 * Storage of the encrypted slots of each batch.  Submissions write into
 * the currently open batch, replacing whatever handle the slot had
 * before.  Reading is possible for any batch and without restrictions.
 */
class EncryptedStateStore
{

private:

  SQLiteDatabase& db;

  const AccessControl& access;
  const PauseControl& pause;
  CooldownThrottle& cooldown;
  const BatchLifecycle& batches;
  EventSink& events;

  /**
   * Runs the checks shared by all submissions (pause, cooldown and open
   * batch) for the given caller.
   */
  OpResult CheckSubmission (const CallContext& ctx) const;

  /**
   * Writes a handle into a slot of the given batch.
   */
  void SetSlot (int64_t batch, Slot s, const uint256& handle);

public:

  explicit EncryptedStateStore (SQLiteDatabase& d, const AccessControl& a,
                                const PauseControl& p, CooldownThrottle& c,
                                const BatchLifecycle& b, EventSink& e)
    : db(d), access(a), pause(p), cooldown(c), batches(b), events(e)
  {}

  EncryptedStateStore () = delete;
  EncryptedStateStore (const EncryptedStateStore&) = delete;
  void operator= (const EncryptedStateStore&) = delete;

  /**
   * Returns the slots of the given batch.  Batches that were never written
   * (including ones that do not exist yet) have all slots unset.
   */
  SlotSet GetSlots (int64_t batch) const;

  /**
   * Stores a news-impact ciphertext submitted by a provider.
   */
  OpResult SubmitNews (const CallContext& ctx, const uint256& handle);

  /**
   * Stores the balance and holding ciphertexts of a trade.  Any account
   * may submit trades.
   */
  OpResult SubmitTrade (const CallContext& ctx, const uint256& balance,
                        const uint256& holding);

};

} // namespace fhetrade

#endif // FHETRADE_SLOTSTORE_HPP
