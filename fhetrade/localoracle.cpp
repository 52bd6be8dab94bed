// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "localoracle.hpp"

#include "slots.hpp"

#include <fheutil/hash.hpp>

#include <glog/logging.h>

namespace fhetrade
{

LocalOracle::LocalOracle (const std::string& k)
  : key(k)
{
  CHECK (!key.empty ()) << "Oracle key must not be empty";
}

uint256
LocalOracle::Encrypt (const uint256& value)
{
  std::lock_guard<std::mutex> lock(mut);

  uint256 handle;
  do
    {
      handle = rnd.Get<uint256> ();
    }
  while (handle.IsNull () || plaintexts.count (handle) > 0);

  plaintexts.emplace (handle, value);
  VLOG (1) << "Minted handle " << handle.ToHex ();

  return handle;
}

uint256
LocalOracle::RequestDecryption (const std::vector<uint256>& handles,
                                const std::string& callback)
{
  std::lock_guard<std::mutex> lock(mut);

  uint256 id;
  do
    {
      id = rnd.Get<uint256> ();
    }
  while (issued.count (id) > 0);

  issued.insert (id);
  pending.emplace (id, handles);

  LOG (INFO)
      << "Decryption request " << id.ToHex () << " for " << handles.size ()
      << " handles, callback " << callback;

  return id;
}

std::string
LocalOracle::Prove (const uint256& requestId,
                    const std::string& cleartexts) const
{
  return HmacSha256 (key, requestId.GetBinaryString () + cleartexts)
            .GetBinaryString ();
}

bool
LocalOracle::VerifyProof (const uint256& requestId,
                          const std::string& cleartexts,
                          const std::string& proof) const
{
  if (proof.size () != uint256::NUM_BYTES)
    {
      VLOG (1) << "Proof has wrong size " << proof.size ();
      return false;
    }

  uint256 provided;
  provided.FromBlob (reinterpret_cast<const unsigned char*> (proof.data ()));

  const uint256 expected
      = HmacSha256 (key, requestId.GetBinaryString () + cleartexts);

  return ConstantTimeEquals (provided, expected);
}

std::vector<uint256>
LocalOracle::GetPendingRequests () const
{
  std::lock_guard<std::mutex> lock(mut);

  std::vector<uint256> res;
  for (const auto& entry : pending)
    res.push_back (entry.first);

  return res;
}

bool
LocalOracle::Fulfil (const uint256& requestId, Fulfilment& res)
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mit = pending.find (requestId);
  if (mit == pending.end ())
    return false;

  PlaintextValues values;
  for (auto& v : values)
    v.SetNull ();

  const auto& handles = mit->second;
  for (size_t i = 0; i < handles.size () && i < NUM_SLOTS; ++i)
    {
      const auto pit = plaintexts.find (handles[i]);
      if (pit != plaintexts.end ())
        values[i] = pit->second;
    }

  res.requestId = requestId;
  res.cleartexts = EncodeCleartexts (values);
  res.proof = Prove (requestId, res.cleartexts);

  return true;
}

bool
LocalOracle::Complete (const uint256& requestId)
{
  std::lock_guard<std::mutex> lock(mut);

  if (pending.erase (requestId) == 0)
    return false;

  VLOG (1) << "Request " << requestId.ToHex () << " is completed";
  return true;
}

} // namespace fhetrade
