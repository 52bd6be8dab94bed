// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include "globals.hpp"
#include "schema.hpp"

#include <glog/logging.h>

#include <sstream>

namespace fhetrade
{

using testing::_;

Json::Value
ParseJson (const std::string& val)
{
  std::istringstream in(val);
  Json::Value res;
  in >> res;
  return res;
}

uint256
TestValue (const uint64_t n)
{
  uint256 res;
  res.SetUint64 (n);
  return res;
}

CallContext
Ctx (const std::string& name, const int64_t timestamp)
{
  CallContext res;
  res.name = name;
  res.timestamp = timestamp;
  return res;
}

MockDecryptionOracle::MockDecryptionOracle ()
{
  EXPECT_CALL (*this, RequestDecryption (_, _)).Times (0);
  EXPECT_CALL (*this, VerifyProof (_, _, _)).Times (0);
}

MockEventSink::MockEventSink ()
{
  EXPECT_CALL (*this, Emit (_, _)).Times (0);
}

DBTest::DBTest ()
  : db("test", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY)
{
  SetupDatabaseSchema (GetDb ());
}

uint256
DBTest::GetTestContract ()
{
  return TestValue (0xC0FFEE);
}

void
DBTest::InitialiseGlobals ()
{
  GlobalState (GetDb ()).Initialise (OWNER, GetTestContract ());
}

} // namespace fhetrade
