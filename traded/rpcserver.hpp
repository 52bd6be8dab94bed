// Copyright (C) 2020-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TRADED_RPCSERVER_HPP
#define TRADED_RPCSERVER_HPP

#include "mainloop.hpp"
#include "traderpcserverstub.h"

#include <fhetrade/events.hpp>
#include <fhetrade/localoracle.hpp>
#include <fhetrade/market.hpp>

#include <json/json.h>
#include <jsonrpccpp/server.h>

#include <string>

namespace fhetrade
{

/**
 * RPC interface for fhetraded.
 */
class RpcServer : public TradeRpcServerStub
{

private:

  /** The market whose state is exposed.  */
  const Market& market;

  /** The event log, read under the market's lock.  */
  const SQLiteEventLog& events;

  /** The local oracle, used to mint handles through "encrypt".  */
  LocalOracle& oracle;

  /** The main loop to stop on request.  */
  MainLoop& loop;

public:

  /** Maximum number of events returned by a single getevents call.  */
  static constexpr int MAX_EVENTS = 1000;

  explicit RpcServer (const Market& m, const SQLiteEventLog& e,
                      LocalOracle& o, MainLoop& l,
                      jsonrpc::AbstractServerConnector& conn)
    : TradeRpcServerStub(conn), market(m), events(e), oracle(o), loop(l)
  {}

  void stop () override;

  Json::Value getstate () override;
  bool isavailable () override;
  Json::Value getbatch () override;
  Json::Value getslots (int batch) override;
  Json::Value getdecryption (const std::string& id) override;
  Json::Value getaccount (const std::string& name) override;
  Json::Value getevents (int fromid, int limit) override;

  std::string encrypt (const Json::Value& value) override;

};

} // namespace fhetrade

#endif // TRADED_RPCSERVER_HPP
