// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "accesscontrol.hpp"

#include <glog/logging.h>

namespace fhetrade
{

std::string
AccessControl::GetOwner () const
{
  return globals.Get<std::string> ("owner");
}

bool
AccessControl::IsOwner (const std::string& name) const
{
  return name == GetOwner ();
}

bool
AccessControl::IsProvider (const std::string& name) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT COUNT(*)
      FROM `providers`
      WHERE `name` = ?1
  )");
  stmt.Bind (1, name);

  CHECK (stmt.Step ());
  const auto count = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());

  CHECK_GE (count, 0);
  CHECK_LE (count, 1);

  return count > 0;
}

std::set<std::string>
AccessControl::GetProviders () const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `name`
      FROM `providers`
      ORDER BY `name`
  )");

  std::set<std::string> res;
  while (stmt.Step ())
    res.insert (stmt.Get<std::string> (0));

  return res;
}

void
AccessControl::EmitProviderEvent (const std::string& name, const bool provider)
{
  Json::Value data(Json::objectValue);
  data["name"] = name;
  data["provider"] = provider;
  events.Emit ("provider", data);
}

OpResult
AccessControl::TransferOwnership (const CallContext& ctx,
                                  const std::string& newOwner)
{
  if (!IsOwner (ctx.name))
    return OpResult::PERMISSION_DENIED;

  if (newOwner.empty ())
    {
      LOG (WARNING) << "Refusing to pass the owner role to an empty name";
      return OpResult::INVALID_ARGUMENT;
    }

  globals.Set<std::string> ("owner", newOwner);
  LOG (INFO) << "Owner role passed from " << ctx.name << " to " << newOwner;

  Json::Value data(Json::objectValue);
  data["previous"] = ctx.name;
  data["owner"] = newOwner;
  events.Emit ("ownership", data);

  return OpResult::OK;
}

OpResult
AccessControl::AddProvider (const CallContext& ctx, const std::string& name)
{
  if (!IsOwner (ctx.name))
    return OpResult::PERMISSION_DENIED;

  if (IsProvider (name))
    {
      VLOG (1) << name << " is already a provider";
      return OpResult::OK;
    }

  auto stmt = db.Prepare (R"(
    INSERT INTO `providers`
      (`name`)
      VALUES (?1)
  )");
  stmt.Bind (1, name);
  stmt.Execute ();

  LOG (INFO) << "Added provider " << name;
  EmitProviderEvent (name, true);

  return OpResult::OK;
}

OpResult
AccessControl::RemoveProvider (const CallContext& ctx, const std::string& name)
{
  if (!IsOwner (ctx.name))
    return OpResult::PERMISSION_DENIED;

  if (!IsProvider (name))
    {
      VLOG (1) << name << " is not a provider";
      return OpResult::OK;
    }

  auto stmt = db.Prepare (R"(
    DELETE FROM `providers`
      WHERE `name` = ?1
  )");
  stmt.Bind (1, name);
  stmt.Execute ();

  LOG (INFO) << "Removed provider " << name;
  EmitProviderEvent (name, false);

  return OpResult::OK;
}

} // namespace fhetrade
