// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "moveprocessor.hpp"

#include "localoracle.hpp"
#include "testutils.hpp"

#include <fheutil/hex.hpp>

#include <glog/logging.h>
#include <gtest/gtest.h>

namespace fhetrade
{
namespace
{

/* ************************************************************************** */

class MoveProcessorTests : public DBTest
{

protected:

  LocalOracle oracle;
  SQLiteEventLog events;
  Market market;
  MoveProcessor proc;

  MoveProcessorTests ()
    : oracle("test key"), events(GetDb ()), market(GetDb (), oracle, events),
      proc(market)
  {
    market.Initialise (OWNER, GetTestContract ());
  }

  /**
   * Processes a block given as JSON string.
   */
  void
  Process (const std::string& block)
  {
    ASSERT_TRUE (proc.ProcessBlock (ParseJson (block)));
  }

  /**
   * Processes a block at the given time with a single move given as
   * JSON string.
   */
  void
  ProcessMove (const std::string& name, const std::string& mv,
               const int64_t timestamp = 100)
  {
    Json::Value entry(Json::objectValue);
    entry["name"] = name;
    entry["move"] = ParseJson (mv);

    Json::Value block(Json::objectValue);
    block["timestamp"] = static_cast<Json::Int64> (timestamp);
    block["moves"] = Json::Value (Json::arrayValue);
    block["moves"].append (entry);

    ASSERT_TRUE (proc.ProcessBlock (block));
  }

  Json::Value
  FullState () const
  {
    return market.ReadState ([] (const StateJsonExtractor& ext)
      {
        return ext.FullState ();
      });
  }

  /**
   * Returns the number of events in the log.
   */
  unsigned
  CountEvents () const
  {
    return events.GetEvents (0, 1'000).size ();
  }

  /**
   * Expects that processing the given move does not change anything.
   */
  void
  ExpectNoChange (const std::string& name, const std::string& mv)
  {
    const auto before = FullState ();
    const unsigned eventsBefore = CountEvents ();

    ProcessMove (name, mv);

    EXPECT_EQ (FullState (), before) << "Move changed state: " << mv;
    EXPECT_EQ (CountEvents (), eventsBefore) << "Move emitted event: " << mv;
  }

};

/* ************************************************************************** */

TEST_F (MoveProcessorTests, InvalidBlocks)
{
  for (const std::string block : {
         "42",
         "[]",
         R"({"moves": []})",
         R"({"timestamp": 1.5, "moves": []})",
         R"({"timestamp": "100", "moves": []})",
         R"({"timestamp": -1, "moves": []})",
         R"({"timestamp": -9223372036854775808, "moves": []})",
         R"({"timestamp": 100})",
         R"({"timestamp": 100, "moves": {}})",
       })
    EXPECT_FALSE (proc.ProcessBlock (ParseJson (block))) << block;

  EXPECT_TRUE (proc.ProcessBlock (ParseJson (R"({"timestamp": 0,
                                                  "moves": []})")));
}

TEST_F (MoveProcessorTests, InvalidMoveEntries)
{
  const auto before = FullState ();
  Process (R"({
    "timestamp": 100,
    "moves":
      [
        42,
        {"move": {"open": {}}},
        {"name": 5, "move": {"open": {}}},
        {"name": "", "move": {"open": {}}},
        {"name": "owner", "move": 42},
        {"name": "owner", "move": [42, "open"]}
      ]
  })");
  EXPECT_EQ (FullState (), before);
}

TEST_F (MoveProcessorTests, InvalidOperations)
{
  for (const std::string mv : {
         "{}",
         R"({"open": {}, "close": {}})",
         R"({"foo": {}})",
         R"({"owner": ""})",
         R"({"owner": 42})",
         R"({"addprovider": null})",
         R"({"removeprovider": {}})",
         R"({"cooldown": -1})",
         R"({"cooldown": 1.5})",
         R"({"cooldown": "10"})",
         R"({"cooldown": 18446744073709551615})",
         R"({"pause": false})",
         R"({"pause": {}})",
         R"({"unpause": 1})",
         R"({"open": true})",
         R"({"open": {"x": 1}})",
         R"({"close": []})",
       })
    ExpectNoChange (OWNER, mv);
}

TEST_F (MoveProcessorTests, RoleMoves)
{
  ProcessMove (OWNER, R"([
    {"addprovider": "andy"},
    {"addprovider": "bob"},
    {"removeprovider": "andy"},
    {"cooldown": 10}
  ])");

  auto state = FullState ();
  EXPECT_EQ (state["roles"]["providers"], ParseJson (R"(["bob"])"));
  EXPECT_EQ (state["cooldown"], 10);

  ProcessMove (OWNER, R"({"owner": "andy"})");
  ProcessMove (OWNER, R"({"owner": "bob"})");
  EXPECT_EQ (FullState ()["roles"]["owner"], "andy");
}

TEST_F (MoveProcessorTests, PauseMoves)
{
  ProcessMove (OWNER, R"({"pause": true})");
  EXPECT_TRUE (FullState ()["paused"].asBool ());

  ProcessMove ("andy", R"({"unpause": true})");
  EXPECT_TRUE (FullState ()["paused"].asBool ());

  ProcessMove (OWNER, R"({"unpause": true})");
  EXPECT_FALSE (FullState ()["paused"].asBool ());
}

TEST_F (MoveProcessorTests, BatchMoves)
{
  ProcessMove (OWNER, R"([{"open": {}}, {"open": {}}])");
  EXPECT_EQ (FullState ()["batch"], ParseJson (R"({"id": 2, "open": true})"));

  ProcessMove (OWNER, R"({"close": {}})");
  EXPECT_EQ (FullState ()["batch"], ParseJson (R"({"id": 2, "open": false})"));
}

TEST_F (MoveProcessorTests, FailedOperationDoesNotAffectOthers)
{
  ProcessMove (OWNER, R"([
    {"close": {}},
    {"open": {}},
    {"unpause": true},
    {"addprovider": "andy"}
  ])");

  const auto state = FullState ();
  EXPECT_EQ (state["batch"], ParseJson (R"({"id": 1, "open": true})"));
  EXPECT_EQ (state["roles"]["providers"], ParseJson (R"(["andy"])"));
}

TEST_F (MoveProcessorTests, Submissions)
{
  ProcessMove (OWNER, R"([{"open": {}}, {"addprovider": "andy"}])");

  const std::string h1 = TestValue (1).ToHex ();
  const std::string h2 = TestValue (2).ToHex ();
  const std::string h3 = TestValue (3).ToHex ();

  ExpectNoChange ("andy", R"({"news": "xyz"})");
  ExpectNoChange ("andy", R"({"news": ")" + h1.substr (2) + R"("})");
  ExpectNoChange ("bob", R"({"trade": {"balance": ")" + h2 + R"("}})");
  ExpectNoChange ("bob", R"({"trade": {
    "balance": ")" + h2 + R"(",
    "holding": 42
  }})");
  ExpectNoChange ("bob", R"({"trade": {
    "balance": ")" + h2 + R"(",
    "holding": ")" + h3 + R"(",
    "extra": 1
  }})");

  ProcessMove ("andy", R"({"news": ")" + h1 + R"("})");
  ProcessMove ("bob", R"({"trade": {
    "balance": ")" + h2 + R"(",
    "holding": ")" + h3 + R"("
  }})");

  EXPECT_EQ (FullState ()["slots"], ParseJson (R"({
    "stockprice": null,
    "playerbalance": ")" + h2 + R"(",
    "playerstockholding": ")" + h3 + R"(",
    "newsimpact": ")" + h1 + R"("
  })"));
}

TEST_F (MoveProcessorTests, BlockTimestampIsCooldownClock)
{
  ProcessMove (OWNER, R"({"open": {}})");

  const std::string trade = R"({"trade": {
    "balance": ")" + TestValue (1).ToHex () + R"(",
    "holding": ")" + TestValue (2).ToHex () + R"("
  }})";
  const std::string otherTrade = R"({"trade": {
    "balance": ")" + TestValue (3).ToHex () + R"(",
    "holding": ")" + TestValue (4).ToHex () + R"("
  }})";

  ProcessMove ("andy", trade, 1'000);
  ProcessMove ("andy", otherTrade, 1'010);
  EXPECT_EQ (FullState ()["slots"]["playerbalance"], TestValue (1).ToHex ());

  ProcessMove ("andy", otherTrade, 1'030);
  EXPECT_EQ (FullState ()["slots"]["playerbalance"], TestValue (3).ToHex ());
}

TEST_F (MoveProcessorTests, DecryptAndFulfil)
{
  const uint256 balance = oracle.Encrypt (TestValue (500));
  const uint256 holding = oracle.Encrypt (TestValue (10));

  ProcessMove (OWNER, R"({"open": {}})");
  ProcessMove ("andy", R"({"trade": {
    "balance": ")" + balance.ToHex () + R"(",
    "holding": ")" + holding.ToHex () + R"("
  }})");

  ExpectNoChange ("andy", R"({"decrypt": []})");
  ExpectNoChange ("andy", R"({"decrypt": {"x": 1}})");

  ProcessMove ("andy", R"({"decrypt": {}})");
  const auto pending = oracle.GetPendingRequests ();
  ASSERT_EQ (pending.size (), 1u);
  EXPECT_EQ (FullState ()["pending"].size (), 1u);

  LocalOracle::Fulfilment f;
  ASSERT_TRUE (oracle.Fulfil (pending[0], f));

  const std::string id = f.requestId.ToHex ();
  const std::string cleartexts = BytesToHex (f.cleartexts);
  const std::string proof = BytesToHex (f.proof);

  ExpectNoChange ("oracle", R"({"fulfil": {
    "id": ")" + id + R"(",
    "cleartexts": ")" + cleartexts + R"("
  }})");
  ExpectNoChange ("oracle", R"({"fulfil": {
    "id": ")" + id + R"(",
    "cleartexts": "zz",
    "proof": ")" + proof + R"("
  }})");
  ExpectNoChange ("oracle", R"({"fulfil": {
    "id": "abc",
    "cleartexts": ")" + cleartexts + R"(",
    "proof": ")" + proof + R"("
  }})");
  ExpectNoChange ("oracle", R"({"fulfil": {
    "id": ")" + id + R"(",
    "cleartexts": ")" + cleartexts + R"(",
    "proof": "00"
  }})");

  ProcessMove ("oracle", R"({"fulfil": {
    "id": ")" + id + R"(",
    "cleartexts": ")" + cleartexts + R"(",
    "proof": ")" + proof + R"("
  }})");
  EXPECT_EQ (FullState ()["pending"].size (), 0u);

  const auto all = events.GetEvents (0, 1'000);
  const auto& last = all[all.size () - 1];
  EXPECT_EQ (last["type"], "decryptioncompleted");
  EXPECT_EQ (last["data"]["playerbalance"], 500);
  EXPECT_EQ (last["data"]["playerstockholding"], 10);
}

/* ************************************************************************** */

} // anonymous namespace
} // namespace fhetrade
