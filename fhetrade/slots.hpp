// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_SLOTS_HPP
#define FHETRADE_SLOTS_HPP

#include <fheutil/uint256.hpp>

#include <json/json.h>

#include <array>
#include <string>

namespace fhetrade
{

/**
 * The encrypted slots kept per batch.  The numeric values define the fixed
 * order used for commitments and for the layout of decrypted cleartexts,
 * and are also what the database stores.
 */
enum class Slot
{
  STOCK_PRICE = 0,
  PLAYER_BALANCE = 1,
  PLAYER_STOCK_HOLDING = 2,
  NEWS_IMPACT = 3,
};

/** Number of encrypted slots per batch.  */
constexpr size_t NUM_SLOTS = 4;

/** All slots in their fixed order.  */
constexpr std::array<Slot, NUM_SLOTS> ALL_SLOTS = {
  Slot::STOCK_PRICE,
  Slot::PLAYER_BALANCE,
  Slot::PLAYER_STOCK_HOLDING,
  Slot::NEWS_IMPACT,
};

/**
 * Returns the name of a slot as used in JSON.
 */
std::string SlotToString (Slot s);

/**
 * The content of a single encrypted slot:  Either unset, or holding
 * the handle of a ciphertext.
 */
class CiphertextSlot
{

private:

  /** Whether there is a handle.  */
  bool set = false;

  /** The handle, if set.  */
  uint256 handle;

public:

  /**
   * Constructs an unset slot.
   */
  CiphertextSlot ()
  {
    handle.SetNull ();
  }

  /**
   * Constructs a slot holding the given handle.
   */
  explicit CiphertextSlot (const uint256& h)
    : set(true), handle(h)
  {}

  CiphertextSlot (const CiphertextSlot&) = default;
  CiphertextSlot& operator= (const CiphertextSlot&) = default;

  bool
  IsSet () const
  {
    return set;
  }

  /**
   * Returns the handle.  Must only be called for set slots.
   */
  const uint256& GetHandle () const;

  /**
   * Returns the handle as hex string, or null if unset.
   */
  Json::Value ToJson () const;

  friend bool
  operator== (const CiphertextSlot& a, const CiphertextSlot& b)
  {
    if (a.set != b.set)
      return false;
    return !a.set || a.handle == b.handle;
  }

  friend bool
  operator!= (const CiphertextSlot& a, const CiphertextSlot& b)
  {
    return !(a == b);
  }

};

/** The four slots of one batch, indexed by the numeric Slot value.  */
using SlotSet = std::array<CiphertextSlot, NUM_SLOTS>;

/** Decrypted plaintext values of the four slots, in slot order.  */
using PlaintextValues = std::array<uint256, NUM_SLOTS>;

/** Size of each plaintext field in the cleartext buffer.  */
constexpr size_t CLEARTEXT_FIELD_BYTES = uint256::NUM_BYTES;

/** Minimum size of a cleartext buffer.  */
constexpr size_t CLEARTEXT_BYTES = NUM_SLOTS * CLEARTEXT_FIELD_BYTES;

/**
 * Computes the commitment to a slot set and the identity of the contract
 * instance.  For each slot in order, a tag byte (zero for unset, one for
 * set) and the 32 handle bytes (zero if unset) are hashed, followed by the
 * contract identity.
 */
uint256 ComputeStateHash (const SlotSet& slots, const uint256& contract);

/**
 * Decodes a cleartext buffer into the four plaintext values, read as
 * big-endian 32-byte integers at offsets 0, 32, 64 and 96.  Bytes after
 * the first 128 are ignored.  Returns false if the buffer is too short.
 */
bool DecodeCleartexts (const std::string& data, PlaintextValues& values);

/**
 * Encodes plaintext values into a 128-byte cleartext buffer.  This is
 * the inverse of DecodeCleartexts, used by oracles.
 */
std::string EncodeCleartexts (const PlaintextValues& values);

} // namespace fhetrade

#endif // FHETRADE_SLOTS_HPP
