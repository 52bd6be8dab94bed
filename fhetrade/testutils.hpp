// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_TESTUTILS_HPP
#define FHETRADE_TESTUTILS_HPP

#include "context.hpp"
#include "database.hpp"
#include "events.hpp"
#include "oracle.hpp"

#include <fheutil/uint256.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sqlite3.h>

#include <json/json.h>

#include <string>
#include <vector>

namespace fhetrade
{

/**
 * Parses JSON from a string.
 */
Json::Value ParseJson (const std::string& val);

/**
 * Returns a uint256 with the given small number as value, which is used
 * as ciphertext handle or request ID in tests.
 */
uint256 TestValue (uint64_t n);

/**
 * Constructs a call context.
 */
CallContext Ctx (const std::string& name, int64_t timestamp);

/**
 * Mock for the decryption oracle.  By default, it does not expect any calls.
 */
class MockDecryptionOracle : public DecryptionOracle
{

public:

  MockDecryptionOracle ();

  MOCK_METHOD2 (RequestDecryption,
                uint256 (const std::vector<uint256>& handles,
                         const std::string& callback));
  MOCK_CONST_METHOD3 (VerifyProof,
                      bool (const uint256& requestId,
                            const std::string& cleartexts,
                            const std::string& proof));

};

/**
 * Mock event sink, for verifying exactly which events an operation emits.
 */
class MockEventSink : public EventSink
{

public:

  MockEventSink ();

  MOCK_METHOD2 (Emit, void (const std::string& type, const Json::Value& data));

};

/**
 * Test fixture with a temporary, in-memory SQLite database and our
 * database schema applied.
 */
class DBTest : public testing::Test
{

private:

  SQLiteDatabase db;

protected:

  /** The owner with which the state is initialised.  */
  static constexpr const char* OWNER = "owner";

  DBTest ();

  /**
   * Returns the underlying database handle for SQLite.
   */
  sqlite3*
  GetHandle ()
  {
    return *db;
  }

  /**
   * Returns a Database instance for the test.
   */
  SQLiteDatabase&
  GetDb ()
  {
    return db;
  }

  /**
   * Initialises the global state with OWNER and a fixed contract ID.
   */
  void InitialiseGlobals ();

  /**
   * Returns the contract ID used by InitialiseGlobals.
   */
  static uint256 GetTestContract ();

};

} // namespace fhetrade

#endif // FHETRADE_TESTUTILS_HPP
