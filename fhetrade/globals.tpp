// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/* Template implementation code for globals.hpp.  */

#include <glog/logging.h>

namespace fhetrade
{

template <typename T>
  T
  GlobalState::Get (const std::string& key) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `value`
      FROM `globals`
      WHERE `key` = ?1
  )");
  stmt.Bind (1, key);

  CHECK (stmt.Step ()) << "Global state has no value for " << key;
  const T res = stmt.Get<T> (0);
  CHECK (!stmt.Step ());

  return res;
}

template <typename T>
  void
  GlobalState::Set (const std::string& key, const T& val)
{
  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `globals`
      (`key`, `value`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, key);
  stmt.Bind (2, val);
  stmt.Execute ();
}

} // namespace fhetrade
