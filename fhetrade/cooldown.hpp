// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_COOLDOWN_HPP
#define FHETRADE_COOLDOWN_HPP

#include "accesscontrol.hpp"
#include "context.hpp"
#include "database.hpp"
#include "events.hpp"
#include "globals.hpp"
#include "opresult.hpp"

#include <cstdint>
#include <string>

namespace fhetrade
{

/**
 * Categories of actions that are rate limited independently of each
 * other.  The values are stored in the database.
 */
enum class ActionCategory
{
  SUBMISSION = 1,
  DECRYPTION_REQUEST = 2,
};

/**
 * Per-account and per-category rate limiting of actions.  An action is
 * only accepted if at least the configured number of seconds has passed
 * since the last accepted action of the same account in the same category.
 */
class CooldownThrottle
{

private:

  SQLiteDatabase& db;
  GlobalState globals;
  const AccessControl& access;
  EventSink& events;

public:

  explicit CooldownThrottle (SQLiteDatabase& d, const AccessControl& a,
                             EventSink& e)
    : db(d), globals(d), access(a), events(e)
  {}

  CooldownThrottle () = delete;
  CooldownThrottle (const CooldownThrottle&) = delete;
  void operator= (const CooldownThrottle&) = delete;

  int64_t GetCooldownSeconds () const;

  /**
   * Changes the cooldown period.  This is only allowed for the owner, and
   * applies right away to all further checks.  Negative periods are
   * refused with INVALID_ARGUMENT.
   */
  OpResult SetCooldownSeconds (const CallContext& ctx, int64_t seconds);

  /**
   * Looks up the time of the last accepted action of an account in the
   * given category.  Returns false if there was none yet.
   */
  bool GetLastAction (const std::string& name, ActionCategory cat,
                      int64_t& timestamp) const;

  /**
   * Checks whether an action by the given account is allowed now.
   */
  OpResult Check (const std::string& name, ActionCategory cat,
                  int64_t now) const;

  /**
   * Records an accepted action at the given time.
   */
  void Record (const std::string& name, ActionCategory cat, int64_t now);

};

/**
 * Returns the name of an action category for JSON.
 */
std::string ActionCategoryToString (ActionCategory cat);

} // namespace fhetrade

#endif // FHETRADE_COOLDOWN_HPP
