// Copyright (C) 2020-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "jsonutils.hpp"

#include "hex.hpp"

#include <glog/logging.h>

namespace fhetrade
{

bool
IsIntegerValue (const Json::Value& val)
{
  switch (val.type ())
    {
    case Json::intValue:
    case Json::uintValue:
      return true;

    default:
      return false;
    }
}

bool
Uint256FromJson (const Json::Value& val, uint256& res)
{
  if (!val.isString ())
    {
      VLOG (1) << "JSON value for uint256 is not a string: " << val;
      return false;
    }

  return res.FromHex (val.asString ());
}

bool
BytesFromJson (const Json::Value& val, std::string& res)
{
  if (!val.isString ())
    {
      VLOG (1) << "JSON value for bytes is not a string: " << val;
      return false;
    }

  return HexToBytes (val.asString (), res);
}

Json::Value
PlaintextToJson (const uint256& val)
{
  uint64_t small;
  if (val.GetUint64 (small))
    return static_cast<Json::UInt64> (small);

  return val.ToHex ();
}

} // namespace fhetrade
