// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "decryption.hpp"

#include "testutils.hpp"

#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace fhetrade
{
namespace
{

using testing::_;
using testing::ElementsAre;
using testing::Return;

/* ************************************************************************** */

class DecryptionTests : public DBTest
{

protected:

  SQLiteEventLog events;
  MockDecryptionOracle oracle;

  AccessControl access;
  PauseControl pause;
  CooldownThrottle cooldown;
  BatchLifecycle batches;
  EncryptedStateStore store;
  DecryptionRequestManager dec;

  /** Cleartexts used for successful fulfilments.  */
  std::string cleartexts;

  DecryptionTests ()
    : events(GetDb ()),
      access(GetDb (), events), pause(GetDb (), access, events),
      cooldown(GetDb (), access, events),
      batches(GetDb (), access, pause, events),
      store(GetDb (), access, pause, cooldown, batches, events),
      dec(GetDb (), pause, cooldown, batches, store, oracle, events)
  {
    InitialiseGlobals ();
    CHECK (access.AddProvider (Ctx (OWNER, 0), "provider") == OpResult::OK);
    CHECK (batches.OpenBatch (Ctx (OWNER, 0)) == OpResult::OK);

    cleartexts = EncodeCleartexts ({
      TestValue (100), TestValue (500), TestValue (10), TestValue (1),
    });
  }

  /**
   * Expects a call to the oracle for the next request, and returns
   * the given ID from it.
   */
  void
  ExpectRequest (const uint64_t id)
  {
    EXPECT_CALL (oracle, RequestDecryption (_, "fulfildecryption"))
        .WillOnce (Return (TestValue (id)));
  }

  /**
   * Requests decryption and expects it to succeed with the given ID.
   */
  void
  Request (const std::string& name, const int64_t ts, const uint64_t id)
  {
    ExpectRequest (id);
    uint256 requestId;
    ASSERT_EQ (dec.RequestBatchDecryption (Ctx (name, ts), requestId),
               OpResult::OK);
    ASSERT_EQ (requestId, TestValue (id));
  }

  /**
   * Returns the processed flag of a request, which must exist.
   */
  bool
  IsProcessed (const uint64_t id)
  {
    DecryptionContext ctx;
    CHECK (dec.GetContext (TestValue (id), ctx));
    return ctx.processed;
  }

  /**
   * Returns the most recent event.
   */
  Json::Value
  LastEvent () const
  {
    const Json::Value all = events.GetEvents (0, 1'000);
    CHECK (!all.empty ());
    return all[all.size () - 1];
  }

  /**
   * Returns the number of events with the given type.
   */
  unsigned
  CountEvents (const std::string& type) const
  {
    unsigned res = 0;
    for (const auto& e : events.GetEvents (0, 1'000))
      if (e["type"].asString () == type)
        ++res;
    return res;
  }

};

/* ************************************************************************** */

using RequestDecryptionTests = DecryptionTests;

TEST_F (RequestDecryptionTests, SnapshotsHandles)
{
  ASSERT_EQ (store.SubmitNews (Ctx ("provider", 0), TestValue (11)),
             OpResult::OK);
  ASSERT_EQ (store.SubmitTrade (Ctx ("andy", 0), TestValue (12),
                                TestValue (13)),
             OpResult::OK);

  uint256 nullHandle;
  nullHandle.SetNull ();

  EXPECT_CALL (oracle, RequestDecryption (
      ElementsAre (nullHandle, TestValue (12), TestValue (13), TestValue (11)),
      "fulfildecryption"))
      .WillOnce (Return (TestValue (7)));

  uint256 requestId;
  ASSERT_EQ (dec.RequestBatchDecryption (Ctx ("andy", 0), requestId),
             OpResult::OK);
  EXPECT_EQ (requestId, TestValue (7));

  DecryptionContext ctx;
  ASSERT_TRUE (dec.GetContext (TestValue (7), ctx));
  EXPECT_EQ (ctx.requestId, TestValue (7));
  EXPECT_EQ (ctx.batch, 1);
  EXPECT_FALSE (ctx.processed);
  EXPECT_EQ (ctx.stateHash,
             ComputeStateHash (store.GetSlots (1), GetTestContract ()));

  const auto ev = LastEvent ();
  EXPECT_EQ (ev["type"], "decryptionrequested");
  EXPECT_EQ (ev["data"], ParseJson (R"({
    "id": ")" + TestValue (7).ToHex () + R"(",
    "batch": 1
  })"));
}

TEST_F (RequestDecryptionTests, AllSlotsUnset)
{
  uint256 nullHandle;
  nullHandle.SetNull ();

  EXPECT_CALL (oracle, RequestDecryption (
      ElementsAre (nullHandle, nullHandle, nullHandle, nullHandle), _))
      .WillOnce (Return (TestValue (1)));

  uint256 requestId;
  EXPECT_EQ (dec.RequestBatchDecryption (Ctx ("andy", 0), requestId),
             OpResult::OK);
}

TEST_F (RequestDecryptionTests, WhilePaused)
{
  ASSERT_EQ (pause.Pause (Ctx (OWNER, 0)), OpResult::OK);

  uint256 requestId;
  EXPECT_EQ (dec.RequestBatchDecryption (Ctx ("andy", 0), requestId),
             OpResult::SYSTEM_PAUSED);
}

TEST_F (RequestDecryptionTests, ClosedBatch)
{
  ASSERT_EQ (batches.CloseBatch (Ctx (OWNER, 0)), OpResult::OK);

  uint256 requestId;
  EXPECT_EQ (dec.RequestBatchDecryption (Ctx ("andy", 0), requestId),
             OpResult::BATCH_NOT_OPEN);
}

TEST_F (RequestDecryptionTests, Cooldown)
{
  Request ("andy", 0, 1);

  uint256 requestId;
  EXPECT_EQ (dec.RequestBatchDecryption (Ctx ("andy", 10), requestId),
             OpResult::COOLDOWN_ACTIVE);

  /* Submissions are throttled separately.  */
  EXPECT_EQ (store.SubmitTrade (Ctx ("andy", 10), TestValue (1),
                                TestValue (2)),
             OpResult::OK);

  Request ("bob", 10, 2);
  Request ("andy", 30, 3);
}

TEST_F (RequestDecryptionTests, ReusedIdIsFatal)
{
  Request ("andy", 0, 7);

  EXPECT_DEATH (
    {
      ExpectRequest (7);
      uint256 requestId;
      dec.RequestBatchDecryption (Ctx ("bob", 0), requestId);
    }, "reused request ID");
}

TEST_F (RequestDecryptionTests, PendingRequests)
{
  Request ("andy", 0, 1);
  Request ("bob", 0, 2);

  const auto pending = dec.GetPending ();
  ASSERT_EQ (pending.size (), 2u);
  EXPECT_EQ (pending[0].requestId, TestValue (1));
  EXPECT_EQ (pending[1].requestId, TestValue (2));
}

/* ************************************************************************** */

class FulfilDecryptionTests : public DecryptionTests
{

protected:

  FulfilDecryptionTests ()
  {
    CHECK (store.SubmitNews (Ctx ("provider", 0), TestValue (11))
              == OpResult::OK);
    CHECK (store.SubmitTrade (Ctx ("andy", 0), TestValue (12),
                              TestValue (13))
              == OpResult::OK);
  }

  /**
   * Expects a proof verification for the given request and our cleartexts,
   * returning the given result.
   */
  void
  ExpectVerify (const uint64_t id, const bool valid)
  {
    EXPECT_CALL (oracle, VerifyProof (TestValue (id), cleartexts, "proof"))
        .WillOnce (Return (valid));
  }

};

TEST_F (FulfilDecryptionTests, Success)
{
  Request ("andy", 0, 7);
  ExpectVerify (7, true);

  ASSERT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::OK);
  EXPECT_TRUE (IsProcessed (7));

  const auto ev = LastEvent ();
  EXPECT_EQ (ev["type"], "decryptioncompleted");
  EXPECT_EQ (ev["data"], ParseJson (R"({
    "id": ")" + TestValue (7).ToHex () + R"(",
    "batch": 1,
    "stockprice": 100,
    "playerbalance": 500,
    "playerstockholding": 10,
    "newsimpact": 1
  })"));
}

TEST_F (FulfilDecryptionTests, LargePlaintext)
{
  Request ("andy", 0, 7);

  uint256 large;
  ASSERT_TRUE (large.FromHex (
      "ff00000000000000000000000000000000000000000000000000000000000001"));
  cleartexts = EncodeCleartexts ({
    large, TestValue (0), TestValue (0), TestValue (0),
  });
  ExpectVerify (7, true);

  ASSERT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::OK);
  EXPECT_EQ (LastEvent ()["data"]["stockprice"], large.ToHex ());
  EXPECT_EQ (LastEvent ()["data"]["newsimpact"], 0);
}

TEST_F (FulfilDecryptionTests, UnknownRequest)
{
  EXPECT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::UNKNOWN_REQUEST);
}

TEST_F (FulfilDecryptionTests, Replay)
{
  Request ("andy", 0, 7);
  ExpectVerify (7, true);

  ASSERT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::OK);
  EXPECT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::REPLAY_ATTEMPT);
  EXPECT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::REPLAY_ATTEMPT);

  EXPECT_TRUE (IsProcessed (7));
  EXPECT_EQ (CountEvents ("decryptioncompleted"), 1);
}

TEST_F (FulfilDecryptionTests, StateMismatch)
{
  Request ("andy", 0, 7);
  ASSERT_EQ (store.SubmitTrade (Ctx ("bob", 0), TestValue (22),
                                TestValue (23)),
             OpResult::OK);

  EXPECT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::STATE_MISMATCH);
  EXPECT_FALSE (IsProcessed (7));
  EXPECT_EQ (CountEvents ("decryptioncompleted"), 0);
}

TEST_F (FulfilDecryptionTests, OverwriteWithSameHandle)
{
  Request ("andy", 0, 7);
  ASSERT_EQ (store.SubmitTrade (Ctx ("bob", 0), TestValue (12),
                                TestValue (13)),
             OpResult::OK);
  ExpectVerify (7, true);

  EXPECT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::OK);
}

TEST_F (FulfilDecryptionTests, InvalidProofThenRetry)
{
  Request ("andy", 0, 7);

  ExpectVerify (7, false);
  EXPECT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::INVALID_PROOF);
  EXPECT_FALSE (IsProcessed (7));

  ExpectVerify (7, true);
  EXPECT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::OK);
  EXPECT_TRUE (IsProcessed (7));
}

TEST_F (FulfilDecryptionTests, MalformedCleartext)
{
  Request ("andy", 0, 7);

  cleartexts = cleartexts.substr (0, 100);
  ExpectVerify (7, true);

  EXPECT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::MALFORMED_CLEARTEXT);
  EXPECT_FALSE (IsProcessed (7));
}

TEST_F (FulfilDecryptionTests, ExtraCleartextBytesIgnored)
{
  Request ("andy", 0, 7);

  cleartexts += std::string (50, '\xFF');
  ExpectVerify (7, true);

  ASSERT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::OK);
  EXPECT_EQ (LastEvent ()["data"]["stockprice"], 100);
  EXPECT_EQ (LastEvent ()["data"]["newsimpact"], 1);
}

TEST_F (FulfilDecryptionTests, NotGatedByPauseOrBatch)
{
  Request ("andy", 0, 7);
  ASSERT_EQ (batches.CloseBatch (Ctx (OWNER, 0)), OpResult::OK);
  ASSERT_EQ (batches.OpenBatch (Ctx (OWNER, 0)), OpResult::OK);
  ASSERT_EQ (pause.Pause (Ctx (OWNER, 0)), OpResult::OK);

  ExpectVerify (7, true);
  EXPECT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::OK);
  EXPECT_EQ (LastEvent ()["data"]["batch"], 1);
}

TEST_F (FulfilDecryptionTests, MultipleRequestsSameBatch)
{
  Request ("andy", 0, 7);
  Request ("bob", 0, 8);

  ExpectVerify (8, true);
  ExpectVerify (7, true);
  EXPECT_EQ (dec.FulfilDecryption (TestValue (8), cleartexts, "proof"),
             OpResult::OK);
  EXPECT_EQ (dec.FulfilDecryption (TestValue (7), cleartexts, "proof"),
             OpResult::OK);

  EXPECT_TRUE (dec.GetPending ().empty ());
}

/* ************************************************************************** */

} // anonymous namespace
} // namespace fhetrade
