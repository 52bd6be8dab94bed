// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_ACCESSCONTROL_HPP
#define FHETRADE_ACCESSCONTROL_HPP

#include "context.hpp"
#include "database.hpp"
#include "events.hpp"
#include "globals.hpp"
#include "opresult.hpp"

#include <set>
#include <string>

namespace fhetrade
{

/**
 * The owner and provider roles.  There is exactly one owner at any time,
 * who may hand the role on and manages the set of providers.
 */
class AccessControl
{

private:

  SQLiteDatabase& db;
  GlobalState globals;
  EventSink& events;

  /**
   * Emits the event for a change in provider membership.
   */
  void EmitProviderEvent (const std::string& name, bool provider);

public:

  explicit AccessControl (SQLiteDatabase& d, EventSink& e)
    : db(d), globals(d), events(e)
  {}

  AccessControl () = delete;
  AccessControl (const AccessControl&) = delete;
  void operator= (const AccessControl&) = delete;

  std::string GetOwner () const;
  bool IsOwner (const std::string& name) const;
  bool IsProvider (const std::string& name) const;

  /**
   * Returns all accounts with the provider role.
   */
  std::set<std::string> GetProviders () const;

  /**
   * Hands the owner role to a new account.  Only the current owner
   * may do this, and the new owner's name must not be empty.
   */
  OpResult TransferOwnership (const CallContext& ctx,
                              const std::string& newOwner);

  /**
   * Grants the provider role.  Only the owner may do this.  Granting it to
   * an account that already is a provider succeeds without any change.
   */
  OpResult AddProvider (const CallContext& ctx, const std::string& name);

  /**
   * Revokes the provider role, with the same rules as AddProvider.
   */
  OpResult RemoveProvider (const CallContext& ctx, const std::string& name);

};

} // namespace fhetrade

#endif // FHETRADE_ACCESSCONTROL_HPP
