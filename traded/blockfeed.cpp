// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "blockfeed.hpp"

#include <glog/logging.h>

#include <memory>
#include <string>

namespace fhetrade
{

void
BlockFeed::FulfilPending ()
{
  CHECK (autoFulfil != nullptr);

  for (const auto& id : autoFulfil->GetPendingRequests ())
    {
      LocalOracle::Fulfilment f;
      if (!autoFulfil->Fulfil (id, f))
        {
          LOG (WARNING) << "Request " << id.ToHex () << " is no longer pending";
          continue;
        }

      const OpResult res
          = market.FulfilDecryption (f.requestId, f.cleartexts, f.proof);
      switch (res)
        {
        case OpResult::OK:
          LOG (INFO) << "Fulfilled decryption request " << id.ToHex ();
          autoFulfil->Complete (id);
          break;

        /* The market has no (more) use for this request.  */
        case OpResult::UNKNOWN_REQUEST:
        case OpResult::REPLAY_ATTEMPT:
          LOG (WARNING)
              << "Dropping request " << id.ToHex () << ": " << res;
          autoFulfil->Complete (id);
          break;

        default:
          LOG (WARNING)
              << "Fulfilment of request " << id.ToHex ()
              << " was rejected, retrying with the next block: " << res;
          break;
        }
    }
}

bool
BlockFeed::ProcessBlock (const Json::Value& block)
{
  if (!proc.ProcessBlock (block))
    return false;

  ++blocks;
  if (autoFulfil != nullptr)
    FulfilPending ();

  return true;
}

unsigned
BlockFeed::ProcessStream (std::istream& in)
{
  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = true;
  rbuilder["failIfExtra"] = true;
  rbuilder["rejectDupKeys"] = true;
  std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader ());

  unsigned processed = 0;
  unsigned lineNumber = 0;
  std::string line;
  while (std::getline (in, line))
    {
      ++lineNumber;
      if (line.find_first_not_of (" \t\r") == std::string::npos)
        continue;

      Json::Value block;
      std::string parseErrs;
      if (!reader->parse (line.data (), line.data () + line.size (),
                          &block, &parseErrs))
        {
          LOG (WARNING)
              << "Invalid JSON in line " << lineNumber << ": " << parseErrs;
          continue;
        }

      if (ProcessBlock (block))
        ++processed;
    }

  LOG (INFO) << "Processed " << processed << " blocks from the input";
  return processed;
}

} // namespace fhetrade
