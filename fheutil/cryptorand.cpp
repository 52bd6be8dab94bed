// Copyright (C) 2019-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "cryptorand.hpp"

#include <glog/logging.h>

#include <openssl/rand.h>

namespace fhetrade
{

std::string
CryptoRand::GetBytes (const size_t len)
{
  std::string res(len, '\0');
  if (len == 0)
    return res;

  CHECK_EQ (RAND_bytes (reinterpret_cast<unsigned char*> (&res[0]), len), 1)
      << "Failed to draw " << len << " random bytes";
  return res;
}

template <>
  uint256
  CryptoRand::Get<uint256> ()
{
  const std::string bytes = GetBytes (uint256::NUM_BYTES);

  uint256 res;
  res.FromBlob (reinterpret_cast<const unsigned char*> (bytes.data ()));
  return res;
}

} // namespace fhetrade
