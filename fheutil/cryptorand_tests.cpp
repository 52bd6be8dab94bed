// Copyright (C) 2019-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "cryptorand.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

namespace fhetrade
{
namespace
{

TEST (CryptoRandTests, BytesHaveRequestedLength)
{
  CryptoRand rnd;
  EXPECT_EQ (rnd.GetBytes (0), "");
  EXPECT_EQ (rnd.GetBytes (1).size (), 1u);
  EXPECT_EQ (rnd.GetBytes (64).size (), 64u);
}

TEST (CryptoRandTests, KeysDiffer)
{
  CryptoRand rnd;
  EXPECT_NE (rnd.GetBytes (32), rnd.GetBytes (32));
}

TEST (CryptoRandTests, RequestIdsDoNotCollide)
{
  /* This cannot show that the values are really random, only that they
     are usable as unique, non-null request IDs.  */
  constexpr unsigned count = 5'000;

  CryptoRand rnd;
  std::set<uint256> seen;
  for (unsigned i = 0; i < count; ++i)
    {
      const auto id = rnd.Get<uint256> ();
      ASSERT_FALSE (id.IsNull ());
      ASSERT_TRUE (seen.insert (id).second) << id.ToHex ();
    }
}

} // anonymous namespace
} // namespace fhetrade
