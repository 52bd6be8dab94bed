// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_OPRESULT_HPP
#define FHETRADE_OPRESULT_HPP

#include <ostream>
#include <string>

namespace fhetrade
{

/**
 * Outcome of a state-changing operation.  Every value other than OK means
 * that the operation was aborted as a whole and nothing was changed.
 */
enum class OpResult
{
  OK = 0,

  /* Authorisation */
  PERMISSION_DENIED,

  /* Parameters of an administrative operation */
  INVALID_ARGUMENT,

  /* Availability */
  SYSTEM_PAUSED,
  ALREADY_PAUSED,
  ALREADY_UNPAUSED,
  BATCH_NOT_OPEN,

  /* Rate limiting */
  COOLDOWN_ACTIVE,

  /* Integrity of the decryption protocol */
  REPLAY_ATTEMPT,
  STATE_MISMATCH,
  INVALID_PROOF,
  UNKNOWN_REQUEST,
  MALFORMED_CLEARTEXT,
};

/**
 * The broad classes into which failures fall.
 */
enum class ErrorCategory
{
  NONE = 0,
  AUTHORIZATION,
  INVALID_INPUT,
  AVAILABILITY,
  RATE_LIMIT,
  PROTOCOL_INTEGRITY,
};

/**
 * Converts a result to a string, e.g. for log messages and JSON.
 */
std::string OpResultToString (OpResult r);

/**
 * Returns the category the given result belongs to.  OK maps to NONE.
 */
ErrorCategory GetErrorCategory (OpResult r);

std::ostream& operator<< (std::ostream& out, OpResult r);

} // namespace fhetrade

#endif // FHETRADE_OPRESULT_HPP
