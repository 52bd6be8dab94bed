// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_LOCALORACLE_HPP
#define FHETRADE_LOCALORACLE_HPP

#include "oracle.hpp"

#include <fheutil/cryptorand.hpp>
#include <fheutil/uint256.hpp>

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace fhetrade
{

/**
 * In-process stand-in for the confidential-compute service, for regtest
 * and demo setups.  Ciphertext handles are random values minted by
 * Encrypt, with the plaintext mapping only known to the oracle itself.
 * Fulfilments are authenticated with an HMAC under a secret key.
 */
class LocalOracle : public DecryptionOracle
{

public:

  /**
   * Data for a fulfilment of a request, as it would be passed to the
   * callback.
   */
  struct Fulfilment
  {
    uint256 requestId;
    std::string cleartexts;
    std::string proof;
  };

private:

  /** The secret key for proofs.  */
  const std::string key;

  /** Source of randomness for handles and request IDs.  */
  CryptoRand rnd;

  /** Plaintexts of the handles we minted.  */
  std::map<uint256, uint256> plaintexts;

  /** Requests that have not been completed yet, with their handles.  */
  std::map<uint256, std::vector<uint256>> pending;

  /** All request IDs ever issued, so that none is issued twice.  */
  std::set<uint256> issued;

  /**
   * Lock for the state of this instance.  The RPC server may mint handles
   * while blocks are being processed.
   */
  mutable std::mutex mut;

  /**
   * Computes the proof for some cleartexts as response to a request.
   */
  std::string Prove (const uint256& requestId,
                     const std::string& cleartexts) const;

public:

  /**
   * Constructs the oracle with the given proof key.  The key must not
   * be empty.
   */
  explicit LocalOracle (const std::string& k);

  /**
   * Mints a new handle for the given plaintext value.
   */
  uint256 Encrypt (const uint256& value);

  uint256 RequestDecryption (const std::vector<uint256>& handles,
                             const std::string& callback) override;

  bool VerifyProof (const uint256& requestId, const std::string& cleartexts,
                    const std::string& proof) const override;

  /**
   * Returns the IDs of all outstanding requests.
   */
  std::vector<uint256> GetPendingRequests () const;

  /**
   * Decrypts the handles of a pending request and produces the fulfilment
   * for it.  Handles unknown to the oracle (including null ones for unset
   * slots) decrypt to zero.  Returns false if the request is not pending.
   *
   * The request stays pending until Complete is called for it, so that
   * a fulfilment the callback rejected can be delivered again.
   */
  bool Fulfil (const uint256& requestId, Fulfilment& res);

  /**
   * Removes a request from the pending set, once its fulfilment has been
   * accepted (or is no longer wanted).  Returns false if the request was
   * not pending.
   */
  bool Complete (const uint256& requestId);

};

} // namespace fhetrade

#endif // FHETRADE_LOCALORACLE_HPP
