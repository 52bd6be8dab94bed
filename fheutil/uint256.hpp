// Copyright (C) 2018-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHEUTIL_UINT256_HPP
#define FHEUTIL_UINT256_HPP

#include <array>
#include <cstdint>
#include <string>

namespace fhetrade
{

/**
 * Opaque 256-bit value, stored as 32 big-endian bytes.  It is used for
 * ciphertext handles, decryption request IDs, the contract identity and
 * commitments, and also holds decrypted plaintexts.  Values can be
 * compared and converted, but there is no arithmetic on them.
 *
 * A default-constructed instance is uninitialised.  The all-zero value
 * is the "null" handle, which marks a slot without ciphertext.
 */
class uint256 final
{

public:

  static constexpr size_t NUM_BYTES = 256 / 8;

private:

  std::array<unsigned char, NUM_BYTES> data;

public:

  /**
   * Formats the value as 64 lower-case hex digits.
   */
  std::string ToHex () const;

  /**
   * Parses exactly 64 hex digits (of either case).  Returns false and
   * leaves the value unspecified if the string is invalid.
   */
  bool FromHex (const std::string& hex);

  /**
   * Returns a pointer to the NUM_BYTES raw bytes.
   */
  const unsigned char*
  GetBlob () const
  {
    return data.data ();
  }

  void FromBlob (const unsigned char* blob);

  /**
   * Returns the raw bytes as std::string, e.g. for hashing.
   */
  std::string GetBinaryString () const;

  /**
   * Sets the value to a number that fits into 64 bits, with the
   * remaining high bytes zero.
   */
  void SetUint64 (uint64_t val);

  /**
   * Reads the value as number.  Returns false if any of the high 24 bytes
   * is non-zero.
   */
  bool GetUint64 (uint64_t& val) const;

  bool IsNull () const;
  void SetNull ();

  friend bool
  operator== (const uint256& a, const uint256& b)
  {
    return a.data == b.data;
  }

  friend bool
  operator!= (const uint256& a, const uint256& b)
  {
    return a.data != b.data;
  }

  /**
   * Orders values by their big-endian bytes, i.e. numerically.  This is
   * used for keys in std::map and std::set.
   */
  friend bool
  operator< (const uint256& a, const uint256& b)
  {
    return a.data < b.data;
  }

};

} // namespace fhetrade

#endif // FHEUTIL_UINT256_HPP
