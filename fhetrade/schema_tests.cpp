// Copyright (C) 2020-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "schema.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

namespace fhetrade
{
namespace
{

using SchemaTests = DBTest;

TEST_F (SchemaTests, Valid)
{
  /* DBTest itself already sets up the schema.  */
}

TEST_F (SchemaTests, MultipleTimesIsOk)
{
  SetupDatabaseSchema (GetDb ());
  SetupDatabaseSchema (GetDb ());
}

TEST_F (SchemaTests, KeepsData)
{
  InitialiseGlobals ();
  SetupDatabaseSchema (GetDb ());

  auto stmt = GetDb ().PrepareRo (R"(
    SELECT COUNT(*) FROM `globals`
  )");
  ASSERT_TRUE (stmt.Step ());
  EXPECT_GT (stmt.Get<int64_t> (0), 0);
}

} // anonymous namespace
} // namespace fhetrade
