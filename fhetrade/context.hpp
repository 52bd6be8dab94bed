// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_CONTEXT_HPP
#define FHETRADE_CONTEXT_HPP

#include <cstdint>
#include <string>

namespace fhetrade
{

/**
 * The caller of an operation together with the time at which it is
 * executed.  For operations coming from moves, the name is the account
 * that sent the move and the timestamp is the block time.
 */
struct CallContext
{

  /** The account that invokes the operation.  */
  std::string name;

  /** The current time, as UNIX timestamp in seconds.  */
  int64_t timestamp;

};

} // namespace fhetrade

#endif // FHETRADE_CONTEXT_HPP
