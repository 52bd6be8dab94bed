// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_MOVEPROCESSOR_HPP
#define FHETRADE_MOVEPROCESSOR_HPP

#include "context.hpp"
#include "market.hpp"
#include "opresult.hpp"

#include <json/json.h>

#include <string>

namespace fhetrade
{

/**
 * Parsing and validation of moves, which are then applied as operations
 * to a Market.  Malformed moves are ignored, and each operation of a move
 * is applied independently of the others.
 */
class MoveProcessor
{

private:

  /** The market to which operations are applied.  */
  Market& market;

  /**
   * Handles an individual operation (i.e. a move that is a JSON object,
   * or an element of an array move).
   */
  void HandleOperation (const CallContext& ctx, const Json::Value& mv);

  /**
   * Handles the role operations, whose value is an account name.
   */
  void HandleRoleChange (const CallContext& ctx, const std::string& type,
                         const Json::Value& op);

  void HandleCooldown (const CallContext& ctx, const Json::Value& op);

  /**
   * Handles pause and unpause, whose value must be true.
   */
  void HandlePause (const CallContext& ctx, bool pause, const Json::Value& op);

  /**
   * Handles opening or closing of a batch, whose value must be an empty
   * object.
   */
  void HandleBatch (const CallContext& ctx, bool open, const Json::Value& op);

  void HandleNews (const CallContext& ctx, const Json::Value& op);
  void HandleTrade (const CallContext& ctx, const Json::Value& op);
  void HandleDecrypt (const CallContext& ctx, const Json::Value& op);
  void HandleFulfil (const CallContext& ctx, const Json::Value& op);

  /**
   * Logs the result of an operation.
   */
  static void Report (const CallContext& ctx, const std::string& type,
                      OpResult res);

public:

  explicit MoveProcessor (Market& m)
    : market(m)
  {}

  MoveProcessor () = delete;
  MoveProcessor (const MoveProcessor&) = delete;
  void operator= (const MoveProcessor&) = delete;

  /**
   * Processes a single move given as JSON object with both the name
   * and the actual move, at the given time.
   */
  void ProcessOne (int64_t timestamp, const Json::Value& obj);

  /**
   * Processes all moves of a block, given as JSON object with
   * "timestamp" (non-negative seconds) and "moves".  Returns false if the
   * block itself is malformed, in which case nothing is done.
   */
  bool ProcessBlock (const Json::Value& block);

};

} // namespace fhetrade

#endif // FHETRADE_MOVEPROCESSOR_HPP
