// Copyright (C) 2019-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <glog/logging.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cstddef>

namespace fhetrade
{

namespace
{

constexpr size_t SHA256_DIGEST_LEN = 32;

EVP_MD_CTX*
AsDigestContext (void* ctx)
{
  CHECK (ctx != nullptr) << "SHA256 instance has been finalised already";
  return static_cast<EVP_MD_CTX*> (ctx);
}

} // anonymous namespace

void
SHA256::ContextDeleter::operator() (void* ctx) const
{
  EVP_MD_CTX_free (static_cast<EVP_MD_CTX*> (ctx));
}

SHA256::SHA256 ()
  : ctx(EVP_MD_CTX_new ())
{
  CHECK (ctx != nullptr);
  CHECK_EQ (EVP_DigestInit_ex (AsDigestContext (ctx.get ()), EVP_sha256 (),
                               nullptr),
            1);
}

SHA256::~SHA256 () = default;

void
SHA256::Update (const void* data, const size_t len)
{
  CHECK_EQ (EVP_DigestUpdate (AsDigestContext (ctx.get ()), data, len), 1);
}

SHA256&
SHA256::operator<< (const std::string& data)
{
  Update (data.data (), data.size ());
  return *this;
}

SHA256&
SHA256::operator<< (const uint256& data)
{
  Update (data.GetBlob (), uint256::NUM_BYTES);
  return *this;
}

uint256
SHA256::Finalise ()
{
  static_assert (SHA256_DIGEST_LEN == uint256::NUM_BYTES,
                 "SHA-256 digests must fit into uint256");

  unsigned char out[SHA256_DIGEST_LEN];
  unsigned outLen;
  CHECK_EQ (EVP_DigestFinal_ex (AsDigestContext (ctx.get ()), out, &outLen),
            1);
  CHECK_EQ (outLen, SHA256_DIGEST_LEN);
  ctx.reset ();

  uint256 res;
  res.FromBlob (out);
  return res;
}

uint256
SHA256::Hash (const std::string& data)
{
  SHA256 hasher;
  hasher << data;
  return hasher.Finalise ();
}

uint256
HmacSha256 (const std::string& key, const std::string& msg)
{
  unsigned char out[SHA256_DIGEST_LEN];
  unsigned outlen;
  CHECK (HMAC (EVP_sha256 (), key.data (), key.size (),
               reinterpret_cast<const unsigned char*> (msg.data ()),
               msg.size (), out, &outlen)
            != nullptr);
  CHECK_EQ (outlen, SHA256_DIGEST_LEN);

  uint256 res;
  res.FromBlob (out);

  return res;
}

bool
ConstantTimeEquals (const uint256& a, const uint256& b)
{
  return CRYPTO_memcmp (a.GetBlob (), b.GetBlob (), uint256::NUM_BYTES) == 0;
}

} // namespace fhetrade
