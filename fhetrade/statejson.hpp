// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_STATEJSON_HPP
#define FHETRADE_STATEJSON_HPP

#include <fheutil/uint256.hpp>

#include <json/json.h>

#include <cstdint>
#include <string>

namespace fhetrade
{

class Market;

/**
 * Read access to the state of a Market, which extracts bits of it as JSON.
 * This is basically the internal implementation of the RPC interface,
 * but without the actual RPC server around and in an easily-testable form.
 * Instances are handed out by Market::ReadState while the market's lock
 * is held.
 */
class StateJsonExtractor
{

private:

  /** The market whose state is read.  */
  const Market& market;

public:

  explicit StateJsonExtractor (const Market& m)
    : market(m)
  {}

  StateJsonExtractor () = delete;
  StateJsonExtractor (const StateJsonExtractor&) = delete;
  void operator= (const StateJsonExtractor&) = delete;

  /**
   * Returns the owner and the list of providers.
   */
  Json::Value GetRoles () const;

  /**
   * Returns whether operations are currently possible, i.e. the
   * system is not paused.
   */
  bool IsAvailable () const;

  /**
   * Returns the current batch ID and whether it is open.
   */
  Json::Value GetBatch () const;

  /**
   * Returns the slots of a given batch together with the current
   * commitment to them.
   */
  Json::Value GetSlots (int64_t batch) const;

  /**
   * Returns the context of a decryption request, or null if there
   * is no such request.
   */
  Json::Value GetDecryption (const uint256& requestId) const;

  /**
   * Returns the role and cooldown data of an account.
   */
  Json::Value GetAccount (const std::string& name) const;

  /**
   * Returns the entire state as JSON.  This includes the slots of the
   * current batch, but not of older ones.
   */
  Json::Value FullState () const;

};

} // namespace fhetrade

#endif // FHETRADE_STATEJSON_HPP
