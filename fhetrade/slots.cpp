// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "slots.hpp"

#include <fheutil/hash.hpp>

#include <glog/logging.h>

namespace fhetrade
{

std::string
SlotToString (const Slot s)
{
  switch (s)
    {
    case Slot::STOCK_PRICE:
      return "stockprice";
    case Slot::PLAYER_BALANCE:
      return "playerbalance";
    case Slot::PLAYER_STOCK_HOLDING:
      return "playerstockholding";
    case Slot::NEWS_IMPACT:
      return "newsimpact";
    }

  LOG (FATAL) << "Unexpected slot: " << static_cast<int> (s);
}

const uint256&
CiphertextSlot::GetHandle () const
{
  CHECK (set) << "Slot has no ciphertext handle";
  return handle;
}

Json::Value
CiphertextSlot::ToJson () const
{
  if (!set)
    return Json::Value ();
  return handle.ToHex ();
}

uint256
ComputeStateHash (const SlotSet& slots, const uint256& contract)
{
  uint256 zero;
  zero.SetNull ();

  SHA256 hasher;
  for (const auto& s : slots)
    {
      if (s.IsSet ())
        hasher << std::string (1, '\x01') << s.GetHandle ();
      else
        hasher << std::string (1, '\x00') << zero;
    }
  hasher << contract;

  return hasher.Finalise ();
}

bool
DecodeCleartexts (const std::string& data, PlaintextValues& values)
{
  if (data.size () < CLEARTEXT_BYTES)
    {
      LOG (WARNING)
          << "Cleartext buffer has only " << data.size () << " bytes,"
          << " expected at least " << CLEARTEXT_BYTES;
      return false;
    }

  const auto* ptr = reinterpret_cast<const unsigned char*> (data.data ());
  for (size_t i = 0; i < NUM_SLOTS; ++i)
    values[i].FromBlob (ptr + i * CLEARTEXT_FIELD_BYTES);

  return true;
}

std::string
EncodeCleartexts (const PlaintextValues& values)
{
  std::string res;
  for (const auto& v : values)
    res += v.GetBinaryString ();

  CHECK_EQ (res.size (), CLEARTEXT_BYTES);
  return res;
}

} // namespace fhetrade
