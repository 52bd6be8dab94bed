// Copyright (C) 2019-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHEUTIL_HASH_HPP
#define FHEUTIL_HASH_HPP

#include "uint256.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace fhetrade
{

/**
 * Utility class to hash data using SHA-256.  This is used to compute the
 * commitments over encrypted slot handles that bind a decryption request
 * to the state it was made for.
 */
class SHA256
{

private:

  /** Frees an OpenSSL digest context.  */
  struct ContextDeleter
  {
    void operator() (void* ctx) const;
  };

  /**
   * The OpenSSL digest context, kept opaque here so that OpenSSL is an
   * implementation detail.  It is null once the hash has been finalised.
   */
  std::unique_ptr<void, ContextDeleter> ctx;

  void Update (const void* data, size_t len);

public:

  SHA256 ();
  ~SHA256 ();

  SHA256 (const SHA256&) = delete;
  void operator= (const SHA256&) = delete;

  SHA256& operator<< (const std::string& data);
  SHA256& operator<< (const uint256& data);

  /**
   * Finalises the hash and returns the resulting value as uint256.  After
   * this function has been called, no more operations on the SHA256 instance
   * are allowed.
   */
  uint256 Finalise ();

  /**
   * Hashes a single string in one go.
   */
  static uint256 Hash (const std::string& data);

};

/**
 * Computes HMAC-SHA-256 of the given message with the given key, and
 * returns the 32-byte MAC.
 */
uint256 HmacSha256 (const std::string& key, const std::string& msg);

/**
 * Compares two uint256 values in constant time.  This must be used when
 * checking a MAC against an expected value.
 */
bool ConstantTimeEquals (const uint256& a, const uint256& b);

} // namespace fhetrade

#endif // FHEUTIL_HASH_HPP
