#include <hybridwork/common/critical.hpp>
#include <hybridwork/crypto/signer.hpp>

#include <openssl/evp.h>

namespace hybridwork::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EVP_PKEY* generate_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    hybridwork::common::critical("failed to initialize Ed25519 keygen");
  }
  auto* pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &pkey) != 1) {
    hybridwork::common::critical("failed to generate Ed25519 key");
  }
  return pkey;
}

}  // namespace

ed25519_signer::ed25519_signer() : key_{generate_ed25519(), EVP_PKEY_free} {
  auto size = attestor_.public_key.size();
  if (EVP_PKEY_get_raw_public_key(key_.get(), attestor_.public_key.data(),
                                  &size) != 1 ||
      size != attestor_.public_key.size()) {
    hybridwork::common::critical("failed to export Ed25519 public key");
  }
}

hybridwork::schema::ed25519_attestor_id ed25519_signer::attestor() const {
  return attestor_;
}

hybridwork::schema::ed25519_signature_t ed25519_signer::sign(
    const hybridwork::schema::bytes_view_t& message) const {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
          1) {
    hybridwork::common::critical("failed to initialize Ed25519 signing");
  }
  auto signature = hybridwork::schema::ed25519_signature_t{};
  auto signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                     message.data(), message.size()) != 1 ||
      signature_size != signature.size()) {
    hybridwork::common::critical("failed to produce Ed25519 signature");
  }
  return signature;
}

}  // namespace hybridwork::crypto
