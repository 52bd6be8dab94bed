// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_GLOBALS_HPP
#define FHETRADE_GLOBALS_HPP

#include "database.hpp"

#include <fheutil/uint256.hpp>

#include <string>

namespace fhetrade
{

/**
 * Access to the single-valued parts of the state (owner, pause flag,
 * cooldown, current batch and the contract identity), which are stored
 * in the "globals" table keyed by name.
 */
class GlobalState
{

private:

  /** The underlying database.  */
  SQLiteDatabase& db;

public:

  /** Default cooldown period in seconds for a fresh state.  */
  static constexpr int64_t DEFAULT_COOLDOWN = 30;

  explicit GlobalState (SQLiteDatabase& d)
    : db(d)
  {}

  GlobalState () = delete;
  GlobalState (const GlobalState&) = delete;
  void operator= (const GlobalState&) = delete;

  /**
   * Returns true if the state has already been initialised.
   */
  bool IsInitialised () const;

  /**
   * Seeds a fresh database with the initial values.  Must only be called
   * if the state is not yet initialised.
   */
  void Initialise (const std::string& owner, const uint256& contract);

  /**
   * Reads the value stored for a given key.  The key must exist.
   */
  template <typename T>
    T Get (const std::string& key) const;

  /**
   * Updates the value stored for a key.
   */
  template <typename T>
    void Set (const std::string& key, const T& val);

  /**
   * Returns the identity of this instance, which is bound into all
   * state commitments.
   */
  uint256
  GetContractId () const
  {
    return Get<uint256> ("contract");
  }

};

} // namespace fhetrade

#include "globals.tpp"

#endif // FHETRADE_GLOBALS_HPP
