// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_PAUSECONTROL_HPP
#define FHETRADE_PAUSECONTROL_HPP

#include "accesscontrol.hpp"
#include "context.hpp"
#include "events.hpp"
#include "globals.hpp"
#include "opresult.hpp"

namespace fhetrade
{

/**
 * The global halt switch.  While paused, all batch and submission
 * operations as well as decryption requests are rejected.
 */
class PauseControl
{

private:

  GlobalState globals;
  const AccessControl& access;
  EventSink& events;

  /**
   * Updates the flag and emits the corresponding event.
   */
  void SetPaused (const CallContext& ctx, bool paused);

public:

  explicit PauseControl (SQLiteDatabase& d, const AccessControl& a,
                         EventSink& e)
    : globals(d), access(a), events(e)
  {}

  PauseControl () = delete;
  PauseControl (const PauseControl&) = delete;
  void operator= (const PauseControl&) = delete;

  bool IsPaused () const;

  OpResult Pause (const CallContext& ctx);
  OpResult Unpause (const CallContext& ctx);

};

} // namespace fhetrade

#endif // FHETRADE_PAUSECONTROL_HPP
