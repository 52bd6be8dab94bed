// Copyright (C) 2019-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHEUTIL_CRYPTORAND_HPP
#define FHEUTIL_CRYPTORAND_HPP

#include "uint256.hpp"

#include <cstddef>
#include <string>

namespace fhetrade
{

/**
 * Source of cryptographically secure randomness (OpenSSL's RAND_bytes).
 * Request IDs, handles of the local oracle, contract identities and
 * oracle keys are drawn from it.
 */
class CryptoRand
{

public:

  CryptoRand () = default;

  CryptoRand (const CryptoRand&) = delete;
  void operator= (const CryptoRand&) = delete;

  /**
   * Returns a string of len random bytes.
   */
  std::string GetBytes (size_t len);

  /**
   * Returns a random value of the given type.  Only uint256 is supported.
   */
  template <typename T>
    T Get ();

};

} // namespace fhetrade

#endif // FHEUTIL_CRYPTORAND_HPP
