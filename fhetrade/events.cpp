// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "events.hpp"

#include <glog/logging.h>

#include <sstream>

namespace fhetrade
{

void
SQLiteEventLog::Emit (const std::string& type, const Json::Value& data)
{
  CHECK (data.isObject ()) << "Event data must be an object: " << data;

  Json::StreamWriterBuilder wbuilder;
  wbuilder["commentStyle"] = "None";
  wbuilder["indentation"] = "";
  wbuilder["enableYAMLCompatibility"] = false;
  wbuilder["dropNullPlaceholders"] = false;
  wbuilder["useSpecialFloats"] = false;
  const std::string serialised = Json::writeString (wbuilder, data);

  auto stmt = db.Prepare (R"(
    INSERT INTO `events`
      (`type`, `data`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, type);
  stmt.Bind (2, serialised);
  stmt.Execute ();

  LOG (INFO) << "Event " << type << ": " << serialised;
}

Json::Value
SQLiteEventLog::GetEvents (const int64_t fromId, const unsigned limit) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `id`, `type`, `data`
      FROM `events`
      WHERE `id` >= ?1
      ORDER BY `id`
      LIMIT ?2
  )");
  stmt.Bind (1, fromId);
  stmt.Bind (2, limit);

  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = true;
  rbuilder["failIfExtra"] = true;
  rbuilder["rejectDupKeys"] = true;

  Json::Value res(Json::arrayValue);
  while (stmt.Step ())
    {
      const std::string serialised = stmt.Get<std::string> (2);

      Json::Value data;
      std::string parseErrs;
      std::istringstream in(serialised);
      CHECK (Json::parseFromStream (rbuilder, in, &data, &parseErrs))
          << "Invalid event data in the database: " << parseErrs
          << "\n" << serialised;

      Json::Value entry(Json::objectValue);
      entry["id"] = static_cast<Json::Int64> (stmt.Get<int64_t> (0));
      entry["type"] = stmt.Get<std::string> (1);
      entry["data"] = data;
      res.append (entry);
    }

  return res;
}

} // namespace fhetrade
