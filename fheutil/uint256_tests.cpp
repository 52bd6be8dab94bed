// Copyright (C) 2018-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "uint256.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>

namespace fhetrade
{
namespace
{

TEST (Uint256Tests, FromValidHex)
{
  uint256 obj;
  ASSERT_TRUE (obj.FromHex ("42" + std::string (60, '0') + "aF"));

  auto* ptr = obj.GetBlob ();
  EXPECT_EQ (*ptr++, 0x42);
  for (size_t i = 1; i < uint256::NUM_BYTES - 1; ++i)
    EXPECT_EQ (*ptr++, 0x00);
  EXPECT_EQ (*ptr++, 0xAF);
}

TEST (Uint256Tests, FromInvalidHex)
{
  uint256 obj;

  EXPECT_FALSE (obj.FromHex (""));
  EXPECT_FALSE (obj.FromHex ("00"));
  EXPECT_FALSE (obj.FromHex (std::string (66, '0')));
  EXPECT_FALSE (obj.FromHex ("xx" + std::string (62, '0')));
}

TEST (Uint256Tests, ToHex)
{
  const std::string hex("02" + std::string (60, '0') + "af");

  uint256 obj;
  ASSERT_TRUE (obj.FromHex (hex));

  EXPECT_EQ (obj.ToHex (), hex);
}

TEST (Uint256Tests, Comparison)
{
  uint256 low1, low2, high;
  low1.SetUint64 (0xFF);
  low2.SetUint64 (0xFF);
  ASSERT_TRUE (high.FromHex ("ff" + std::string (62, '0')));

  EXPECT_TRUE (low1 == low2);
  EXPECT_FALSE (low1 == high);
  EXPECT_TRUE (low1 != high);

  EXPECT_TRUE (low1 < high);
  EXPECT_FALSE (low1 < low2);
  EXPECT_FALSE (high < low1);
}

TEST (Uint256Tests, BinaryString)
{
  uint256 obj;
  ASSERT_TRUE (obj.FromHex ("42" + std::string (60, '0') + "24"));

  const std::string bin = obj.GetBinaryString ();
  ASSERT_EQ (bin.size (), uint256::NUM_BYTES);
  EXPECT_EQ (bin.front (), '\x42');
  EXPECT_EQ (bin.back (), '\x24');

  uint256 copy;
  copy.FromBlob (reinterpret_cast<const unsigned char*> (bin.data ()));
  EXPECT_EQ (obj, copy);
}

TEST (Uint256Tests, Uint64)
{
  uint256 obj;
  obj.SetUint64 (0x0102030405060708);
  EXPECT_EQ (obj.ToHex (), std::string (48, '0') + "0102030405060708");

  uint64_t val;
  ASSERT_TRUE (obj.GetUint64 (val));
  EXPECT_EQ (val, 0x0102030405060708ull);

  obj.SetUint64 (std::numeric_limits<uint64_t>::max ());
  ASSERT_TRUE (obj.GetUint64 (val));
  EXPECT_EQ (val, std::numeric_limits<uint64_t>::max ());

  ASSERT_TRUE (obj.FromHex (std::string (47, '0') + "1" + std::string (16, '0')));
  EXPECT_FALSE (obj.GetUint64 (val));
}

TEST (Uint256Tests, IsNull)
{
  uint256 obj;
  ASSERT_TRUE (obj.FromHex (std::string (64, '0')));
  EXPECT_TRUE (obj.IsNull ());

  obj.SetUint64 (1);
  EXPECT_FALSE (obj.IsNull ());
  ASSERT_TRUE (obj.FromHex ("01" + std::string (62, '0')));
  EXPECT_FALSE (obj.IsNull ());

  obj.SetNull ();
  EXPECT_TRUE (obj.IsNull ());
  EXPECT_EQ (obj.ToHex (), std::string (64, '0'));
}

} // anonymous namespace
} // namespace fhetrade
