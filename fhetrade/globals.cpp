// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "globals.hpp"

namespace fhetrade
{

bool
GlobalState::IsInitialised () const
{
  auto stmt = db.PrepareRo (R"(
    SELECT COUNT(*)
      FROM `globals`
      WHERE `key` = 'owner'
  )");

  CHECK (stmt.Step ());
  const auto count = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());

  return count > 0;
}

void
GlobalState::Initialise (const std::string& owner, const uint256& contract)
{
  CHECK (!IsInitialised ()) << "Global state is already initialised";
  CHECK (!owner.empty ()) << "Initial owner must not be empty";

  LOG (INFO)
      << "Initialising state with owner " << owner
      << " and contract identity " << contract.ToHex ();

  Set<std::string> ("owner", owner);
  Set<bool> ("paused", false);
  Set<int64_t> ("cooldown", DEFAULT_COOLDOWN);
  Set<int64_t> ("batch", 0);
  Set<bool> ("open", false);
  Set<uint256> ("contract", contract);
}

} // namespace fhetrade
