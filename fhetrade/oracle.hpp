// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_ORACLE_HPP
#define FHETRADE_ORACLE_HPP

#include <fheutil/uint256.hpp>

#include <string>
#include <vector>

namespace fhetrade
{

/**
 * Interface to the external confidential-compute service that decrypts
 * ciphertexts outside of our own processing.  A decryption is requested
 * for a list of handles; the oracle later calls back with the cleartexts
 * and a proof that can be checked through VerifyProof.
 */
class DecryptionOracle
{

public:

  DecryptionOracle () = default;
  virtual ~DecryptionOracle () = default;

  DecryptionOracle (const DecryptionOracle&) = delete;
  void operator= (const DecryptionOracle&) = delete;

  /**
   * Submits the given handles for decryption.  Null handles stand for
   * unset slots.  The callback identifies the entry point that the oracle
   * should call with the result.  Returns a request ID that must never
   * have been issued before.
   */
  virtual uint256 RequestDecryption (const std::vector<uint256>& handles,
                                     const std::string& callback) = 0;

  /**
   * Checks that the proof attests a correct decryption with the given
   * cleartexts for the given request.
   */
  virtual bool VerifyProof (const uint256& requestId,
                            const std::string& cleartexts,
                            const std::string& proof) const = 0;

};

} // namespace fhetrade

#endif // FHETRADE_ORACLE_HPP
