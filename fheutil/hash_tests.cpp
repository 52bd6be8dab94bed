// Copyright (C) 2019-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <gtest/gtest.h>

namespace fhetrade
{
namespace
{

class SHA256Tests : public testing::Test
{

protected:

  SHA256 hasher;

};

TEST_F (SHA256Tests, Empty)
{
  EXPECT_EQ (hasher.Finalise ().ToHex (),
     "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F (SHA256Tests, NonEmpty)
{
  uint256 someData;
  ASSERT_TRUE (someData.FromHex (
      "2e773fdbfcb9e80875ce3f2f44a4d17fd9d6a62023cad54bc79f394403e6a6ab"));

  hasher << "foo";
  hasher << "";
  hasher << someData;
  hasher << "";
  hasher << "bar";

  /* Total data that is being hashed (in hex):
      666f6f
      2e773fdbfcb9e80875ce3f2f44a4d17fd9d6a62023cad54bc79f394403e6a6ab
      626172
  */
  EXPECT_EQ (hasher.Finalise ().ToHex (),
      "bdd7344649494d3f16b5c3bbc9989efe64bba2ce0651d6980aab2f12cef4fb0d");
}

TEST_F (SHA256Tests, UtilityHash)
{
  EXPECT_EQ (SHA256::Hash ("").ToHex (),
      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ (SHA256::Hash ("foobar").ToHex (),
      "c3ab8ff13720e8ad9047dd39466b3c8974e592c2fa383d4a3960714caef0c4f2");
}

TEST (HmacTests, Rfc4231Case2)
{
  EXPECT_EQ (HmacSha256 ("Jefe", "what do ya want for nothing?").ToHex (),
      "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST (HmacTests, KeyMatters)
{
  EXPECT_NE (HmacSha256 ("key 1", "message"), HmacSha256 ("key 2", "message"));
  EXPECT_EQ (HmacSha256 ("key", "message"), HmacSha256 ("key", "message"));
}

TEST (HmacTests, ConstantTimeEquals)
{
  uint256 a, b;
  a.SetUint64 (42);
  b.SetUint64 (42);
  EXPECT_TRUE (ConstantTimeEquals (a, b));

  b.SetUint64 (43);
  EXPECT_FALSE (ConstantTimeEquals (a, b));
}

} // anonymous namespace
} // namespace fhetrade
