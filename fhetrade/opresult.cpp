// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "opresult.hpp"

#include <glog/logging.h>

namespace fhetrade
{

std::string
OpResultToString (const OpResult r)
{
  switch (r)
    {
    case OpResult::OK:
      return "ok";
    case OpResult::PERMISSION_DENIED:
      return "permission denied";
    case OpResult::INVALID_ARGUMENT:
      return "invalid argument";
    case OpResult::SYSTEM_PAUSED:
      return "system paused";
    case OpResult::ALREADY_PAUSED:
      return "already paused";
    case OpResult::ALREADY_UNPAUSED:
      return "already unpaused";
    case OpResult::BATCH_NOT_OPEN:
      return "batch not open";
    case OpResult::COOLDOWN_ACTIVE:
      return "cooldown active";
    case OpResult::REPLAY_ATTEMPT:
      return "replay attempt";
    case OpResult::STATE_MISMATCH:
      return "state mismatch";
    case OpResult::INVALID_PROOF:
      return "invalid proof";
    case OpResult::UNKNOWN_REQUEST:
      return "unknown request";
    case OpResult::MALFORMED_CLEARTEXT:
      return "malformed cleartext";
    }

  LOG (FATAL) << "Unexpected OpResult: " << static_cast<int> (r);
}

ErrorCategory
GetErrorCategory (const OpResult r)
{
  switch (r)
    {
    case OpResult::OK:
      return ErrorCategory::NONE;

    case OpResult::PERMISSION_DENIED:
      return ErrorCategory::AUTHORIZATION;

    case OpResult::INVALID_ARGUMENT:
      return ErrorCategory::INVALID_INPUT;

    case OpResult::SYSTEM_PAUSED:
    case OpResult::ALREADY_PAUSED:
    case OpResult::ALREADY_UNPAUSED:
    case OpResult::BATCH_NOT_OPEN:
      return ErrorCategory::AVAILABILITY;

    case OpResult::COOLDOWN_ACTIVE:
      return ErrorCategory::RATE_LIMIT;

    case OpResult::REPLAY_ATTEMPT:
    case OpResult::STATE_MISMATCH:
    case OpResult::INVALID_PROOF:
    case OpResult::UNKNOWN_REQUEST:
    case OpResult::MALFORMED_CLEARTEXT:
      return ErrorCategory::PROTOCOL_INTEGRITY;
    }

  LOG (FATAL) << "Unexpected OpResult: " << static_cast<int> (r);
}

std::ostream&
operator<< (std::ostream& out, const OpResult r)
{
  return out << OpResultToString (r);
}

} // namespace fhetrade
