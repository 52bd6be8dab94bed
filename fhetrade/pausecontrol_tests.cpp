// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pausecontrol.hpp"

#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace fhetrade
{
namespace
{

class PauseControlTests : public DBTest
{

protected:

  MockEventSink events;
  AccessControl access;
  PauseControl pause;

  PauseControlTests ()
    : access(GetDb (), events), pause(GetDb (), access, events)
  {
    InitialiseGlobals ();
  }

};

TEST_F (PauseControlTests, InitiallyUnpaused)
{
  EXPECT_FALSE (pause.IsPaused ());
}

TEST_F (PauseControlTests, OnlyOwner)
{
  EXPECT_EQ (pause.Pause (Ctx ("andy", 0)), OpResult::PERMISSION_DENIED);
  EXPECT_FALSE (pause.IsPaused ());
}

TEST_F (PauseControlTests, PauseAndUnpause)
{
  {
    testing::InSequence seq;
    EXPECT_CALL (events, Emit ("pause", ParseJson (R"({
      "paused": true,
      "by": "owner"
    })")));
    EXPECT_CALL (events, Emit ("pause", ParseJson (R"({
      "paused": false,
      "by": "owner"
    })")));
  }

  EXPECT_EQ (pause.Unpause (Ctx (OWNER, 0)), OpResult::ALREADY_UNPAUSED);

  EXPECT_EQ (pause.Pause (Ctx (OWNER, 0)), OpResult::OK);
  EXPECT_TRUE (pause.IsPaused ());
  EXPECT_EQ (pause.Pause (Ctx (OWNER, 0)), OpResult::ALREADY_PAUSED);
  EXPECT_EQ (pause.Unpause (Ctx ("andy", 0)), OpResult::PERMISSION_DENIED);
  EXPECT_TRUE (pause.IsPaused ());

  EXPECT_EQ (pause.Unpause (Ctx (OWNER, 0)), OpResult::OK);
  EXPECT_FALSE (pause.IsPaused ());
}

TEST_F (PauseControlTests, PermissionCheckedFirst)
{
  EXPECT_CALL (events, Emit ("pause", testing::_));
  ASSERT_EQ (pause.Pause (Ctx (OWNER, 0)), OpResult::OK);
  EXPECT_EQ (pause.Pause (Ctx ("andy", 0)), OpResult::PERMISSION_DENIED);
}

} // anonymous namespace
} // namespace fhetrade
