// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "cooldown.hpp"

#include <glog/logging.h>

namespace fhetrade
{

std::string
ActionCategoryToString (const ActionCategory cat)
{
  switch (cat)
    {
    case ActionCategory::SUBMISSION:
      return "submission";
    case ActionCategory::DECRYPTION_REQUEST:
      return "decryptionrequest";
    }

  LOG (FATAL) << "Invalid action category: " << static_cast<int> (cat);
}

int64_t
CooldownThrottle::GetCooldownSeconds () const
{
  return globals.Get<int64_t> ("cooldown");
}

OpResult
CooldownThrottle::SetCooldownSeconds (const CallContext& ctx,
                                      const int64_t seconds)
{
  if (!access.IsOwner (ctx.name))
    return OpResult::PERMISSION_DENIED;

  if (seconds < 0)
    {
      LOG (WARNING) << "Refusing negative cooldown period " << seconds;
      return OpResult::INVALID_ARGUMENT;
    }

  globals.Set<int64_t> ("cooldown", seconds);
  LOG (INFO) << "Cooldown period set to " << seconds << " seconds";

  Json::Value data(Json::objectValue);
  data["seconds"] = static_cast<Json::Int64> (seconds);
  events.Emit ("cooldown", data);

  return OpResult::OK;
}

bool
CooldownThrottle::GetLastAction (const std::string& name,
                                 const ActionCategory cat,
                                 int64_t& timestamp) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `timestamp`
      FROM `cooldowns`
      WHERE `name` = ?1 AND `category` = ?2
  )");
  stmt.Bind (1, name);
  stmt.Bind (2, static_cast<int> (cat));

  if (!stmt.Step ())
    return false;

  timestamp = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());

  return true;
}

OpResult
CooldownThrottle::Check (const std::string& name, const ActionCategory cat,
                         const int64_t now) const
{
  int64_t last;
  if (!GetLastAction (name, cat, last))
    return OpResult::OK;

  /* The elapsed time is computed unsigned, which cannot overflow for
     now >= last.  */
  const int64_t cooldown = GetCooldownSeconds ();
  CHECK_GE (cooldown, 0);
  if (now < last
        || static_cast<uint64_t> (now) - static_cast<uint64_t> (last)
              < static_cast<uint64_t> (cooldown))
    {
      VLOG (1)
          << name << " last acted in " << ActionCategoryToString (cat)
          << " at " << last << ", now is " << now
          << " with a cooldown of " << cooldown << " seconds";
      return OpResult::COOLDOWN_ACTIVE;
    }

  return OpResult::OK;
}

void
CooldownThrottle::Record (const std::string& name, const ActionCategory cat,
                          const int64_t now)
{
  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `cooldowns`
      (`name`, `category`, `timestamp`)
      VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, name);
  stmt.Bind (2, static_cast<int> (cat));
  stmt.Bind (3, now);
  stmt.Execute ();
}

} // namespace fhetrade
