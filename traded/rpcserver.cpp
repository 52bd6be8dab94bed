// Copyright (C) 2020-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcserver.hpp"

#include <fhetrade/statejson.hpp>
#include <fheutil/jsonutils.hpp>
#include <fheutil/uint256.hpp>

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

#include <sstream>

namespace fhetrade
{

namespace
{

/**
 * Throws a JSON-RPC exception for invalid parameters.
 */
void
ThrowInvalidParams (const std::string& msg)
{
  throw jsonrpc::JsonRpcException (
      jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS, msg);
}

/**
 * Parses a plaintext value, which can either be given as non-negative
 * integer or as 64-digit hex string.
 */
uint256
GetPlaintext (const Json::Value& val)
{
  uint256 res;

  if (IsIntegerValue (val) && val.isUInt64 ())
    {
      res.SetUint64 (val.asUInt64 ());
      return res;
    }

  if (Uint256FromJson (val, res))
    return res;

  std::ostringstream out;
  out << "invalid plaintext value: " << val;
  ThrowInvalidParams (out.str ());
  return res;
}

} // anonymous namespace

void
RpcServer::stop ()
{
  LOG (INFO) << "RPC method called: stop";
  loop.Stop ();
}

Json::Value
RpcServer::getstate ()
{
  LOG (INFO) << "RPC method called: getstate";
  return market.ReadState ([] (const StateJsonExtractor& ext)
    {
      return ext.FullState ();
    });
}

bool
RpcServer::isavailable ()
{
  LOG (INFO) << "RPC method called: isavailable";
  const Json::Value res = market.ReadState ([] (const StateJsonExtractor& ext)
    {
      return Json::Value (ext.IsAvailable ());
    });
  return res.asBool ();
}

Json::Value
RpcServer::getbatch ()
{
  LOG (INFO) << "RPC method called: getbatch";
  return market.ReadState ([] (const StateJsonExtractor& ext)
    {
      return ext.GetBatch ();
    });
}

Json::Value
RpcServer::getslots (const int batch)
{
  LOG (INFO) << "RPC method called: getslots " << batch;
  if (batch < 0)
    ThrowInvalidParams ("batch must not be negative");

  return market.ReadState ([batch] (const StateJsonExtractor& ext)
    {
      return ext.GetSlots (batch);
    });
}

Json::Value
RpcServer::getdecryption (const std::string& id)
{
  LOG (INFO) << "RPC method called: getdecryption " << id;

  uint256 requestId;
  if (!requestId.FromHex (id))
    ThrowInvalidParams ("invalid request ID: " + id);

  return market.ReadState ([&requestId] (const StateJsonExtractor& ext)
    {
      return ext.GetDecryption (requestId);
    });
}

Json::Value
RpcServer::getaccount (const std::string& name)
{
  LOG (INFO) << "RPC method called: getaccount " << name;
  if (name.empty ())
    ThrowInvalidParams ("account name must not be empty");

  return market.ReadState ([&name] (const StateJsonExtractor& ext)
    {
      return ext.GetAccount (name);
    });
}

Json::Value
RpcServer::getevents (const int fromid, const int limit)
{
  LOG (INFO) << "RPC method called: getevents " << fromid << " " << limit;
  if (fromid < 0)
    ThrowInvalidParams ("fromid must not be negative");
  if (limit <= 0 || limit > MAX_EVENTS)
    {
      std::ostringstream out;
      out << "limit must be between 1 and " << MAX_EVENTS;
      ThrowInvalidParams (out.str ());
    }

  return market.ReadState ([this, fromid, limit] (const StateJsonExtractor&)
    {
      return events.GetEvents (fromid, limit);
    });
}

std::string
RpcServer::encrypt (const Json::Value& value)
{
  LOG (INFO) << "RPC method called: encrypt";
  return oracle.Encrypt (GetPlaintext (value)).ToHex ();
}

} // namespace fhetrade
