// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/ed25519.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace tangle {
namespace wallet {

namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr LoadPrivate(const Ed25519PrivateKey& key) {
  PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, key.data(), key.size()));
  if (!pkey) {
    throw std::runtime_error("EVP_PKEY_new_raw_private_key(ED25519) failed");
  }
  return pkey;
}

}  // namespace

Ed25519PublicKey Ed25519DerivePublicKey(const Ed25519PrivateKey& private_key) {
  PkeyPtr pkey = LoadPrivate(private_key);
  Ed25519PublicKey pub{};
  size_t len = pub.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), pub.data(), &len) != 1 || len != pub.size()) {
    throw std::runtime_error("EVP_PKEY_get_raw_public_key failed");
  }
  return pub;
}

Ed25519Sig Ed25519Sign(const Ed25519PrivateKey& private_key, std::span<const uint8_t> message) {
  PkeyPtr pkey = LoadPrivate(private_key);
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
    throw std::runtime_error("EVP_DigestSignInit(ED25519) failed");
  }
  Ed25519Sig sig{};
  size_t len = sig.size();
  if (EVP_DigestSign(ctx.get(), sig.data(), &len, message.data(), message.size()) != 1 || len != sig.size()) {
    throw std::runtime_error("EVP_DigestSign(ED25519) failed");
  }
  return sig;
}

bool Ed25519Verify(const Ed25519PublicKey& public_key, std::span<const uint8_t> message, const Ed25519Sig& signature) {
  PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (!pkey) {
    return false;
  }
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
    throw std::runtime_error("EVP_DigestVerifyInit(ED25519) failed");
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size()) == 1;
}

}  // namespace wallet
}  // namespace tangle
