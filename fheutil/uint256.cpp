// Copyright (C) 2018-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "uint256.hpp"

#include "hex.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace fhetrade
{

std::string
uint256::ToHex () const
{
  return BytesToHex (GetBinaryString ());
}

bool
uint256::FromHex (const std::string& hex)
{
  if (hex.size () != NUM_BYTES * 2)
    {
      LOG (ERROR) << "Invalid-sized string for uint256: " << hex;
      return false;
    }

  std::string bytes;
  if (!HexToBytes (hex, bytes))
    return false;

  CHECK_EQ (bytes.size (), NUM_BYTES);
  FromBlob (reinterpret_cast<const unsigned char*> (bytes.data ()));
  return true;
}

void
uint256::FromBlob (const unsigned char* blob)
{
  std::copy (blob, blob + NUM_BYTES, data.data ());
}

std::string
uint256::GetBinaryString () const
{
  return std::string (reinterpret_cast<const char*> (GetBlob ()), NUM_BYTES);
}

void
uint256::SetUint64 (uint64_t val)
{
  SetNull ();
  for (size_t i = 0; i < sizeof (val); ++i)
    {
      data[NUM_BYTES - 1 - i] = val & 0xFF;
      val >>= 8;
    }
}

bool
uint256::GetUint64 (uint64_t& val) const
{
  constexpr size_t highBytes = NUM_BYTES - sizeof (val);
  if (!std::all_of (data.begin (), data.begin () + highBytes,
                    [] (const unsigned char b) { return b == 0; }))
    return false;

  val = 0;
  for (size_t i = highBytes; i < NUM_BYTES; ++i)
    val = (val << 8) | data[i];

  return true;
}

bool
uint256::IsNull () const
{
  return std::all_of (data.begin (), data.end (),
                      [] (const unsigned char val) { return val == 0; });
}

void
uint256::SetNull ()
{
  std::fill (data.begin (), data.end (), 0);
}

} // namespace fhetrade
