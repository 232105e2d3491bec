#pragma once

#include <hybridwork/schema/primitives.hpp>

#include <openssl/types.h>

#include <memory>

namespace hybridwork::crypto {

/// Ed25519 signing key held by an attestation source.
class ed25519_signer final {
 public:
  /// Generate a fresh key pair; terminates if OpenSSL cannot.
  ed25519_signer();

  ed25519_signer(const ed25519_signer&) = delete;
  ed25519_signer& operator=(const ed25519_signer&) = delete;
  ed25519_signer(ed25519_signer&&) noexcept = default;
  ed25519_signer& operator=(ed25519_signer&&) noexcept = default;
  ~ed25519_signer() = default;

  hybridwork::schema::ed25519_attestor_id attestor() const;

  hybridwork::schema::ed25519_signature_t sign(
      const hybridwork::schema::bytes_view_t& message) const;

 private:
  std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY*)> key_;
  hybridwork::schema::ed25519_attestor_id attestor_{};
};

}  // namespace hybridwork::crypto
