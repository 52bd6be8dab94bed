// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TRADED_BLOCKFEED_HPP
#define TRADED_BLOCKFEED_HPP

#include <fhetrade/localoracle.hpp>
#include <fhetrade/market.hpp>
#include <fhetrade/moveprocessor.hpp>

#include <json/json.h>

#include <istream>

namespace fhetrade
{

/**
 * Feeds blocks into the market.  Blocks are read as one JSON object
 * per line from an input stream and processed in order.  Optionally the
 * local oracle answers all outstanding decryption requests after each
 * block, which lets a regtest setup run full rounds unattended.
 */
class BlockFeed
{

private:

  Market& market;
  MoveProcessor proc;

  /** The local oracle, used for automatic fulfilments if not null.  */
  LocalOracle* autoFulfil;

  /** Number of blocks processed successfully so far.  */
  unsigned blocks = 0;

  /**
   * Delivers the fulfilments for all pending requests of the local oracle
   * through the market's callback.  Requests are completed in the oracle
   * once the market accepted them or does not know them (anymore).
   * Rejected ones stay pending and are delivered again after the next
   * block.
   */
  void FulfilPending ();

public:

  explicit BlockFeed (Market& m)
    : market(m), proc(m), autoFulfil(nullptr)
  {}

  BlockFeed () = delete;
  BlockFeed (const BlockFeed&) = delete;
  void operator= (const BlockFeed&) = delete;

  /**
   * Turns on automatic fulfilment of pending requests through the given
   * oracle.  It must be the oracle the market sends its requests to.
   */
  void
  EnableAutoFulfil (LocalOracle& o)
  {
    autoFulfil = &o;
  }

  /**
   * Processes a single block given as JSON.  Returns false if the block
   * was malformed and ignored.
   */
  bool ProcessBlock (const Json::Value& block);

  /**
   * Reads and processes all blocks from the stream until its end.  Empty
   * lines are skipped, and so are lines that are not valid JSON (with
   * a warning).  Returns the number of blocks processed.
   */
  unsigned ProcessStream (std::istream& in);

  unsigned
  GetNumBlocks () const
  {
    return blocks;
  }

};

} // namespace fhetrade

#endif // TRADED_BLOCKFEED_HPP
