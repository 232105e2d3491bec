#include <hybridwork/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace hybridwork::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool digest_verify(EVP_PKEY* pkey,
                   const EVP_MD* md,
                   const uint8_t* signature,
                   const size_t signature_size,
                   const hybridwork::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature, signature_size, message.data(),
                          message.size()) == 1;
}

bool verify_ed25519(const hybridwork::schema::bytes_view_t& message,
                    const hybridwork::schema::ed25519_attestor_id& attestor,
                    const hybridwork::schema::ed25519_signature_t& proof) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               attestor.public_key.data(),
                                               attestor.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey.get(), nullptr, proof.data(), proof.size(),
                       message);
}

// Strip the recovery byte from either end of a 65-byte secp256k1 proof.
// Recovery ids 0..3 and legacy 27+ are accepted; 4..26 are rejected.
std::optional<std::array<uint8_t, 64>> compact_secp_proof(
    const hybridwork::schema::secp256k1_signature_t& proof) {
  auto out = std::array<uint8_t, 64>{};
  if (proof[0] <= 3 || proof[0] >= 27) {
    std::copy_n(proof.data() + 1, out.size(), out.data());
    return out;
  }
  if (proof[64] <= 3 || proof[64] >= 27) {
    std::copy_n(proof.data(), out.size(), out.data());
    return out;
  }
  return std::nullopt;
}

std::optional<std::vector<uint8_t>> to_der(const std::array<uint8_t, 64>& rs) {
  auto sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }
  auto r = bignum_ptr{BN_bin2bn(rs.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(rs.data() + 32, 32, nullptr), BN_free};
  if (!r || !s || ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // ECDSA_SIG_set0 took ownership.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

evp_pkey_ptr load_secp256k1_key(
    const hybridwork::schema::secp256k1_attestor_id& attestor) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(attestor.public_key.data()),
                     attestor.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

bool verify_secp256k1(const hybridwork::schema::bytes_view_t& message,
                      const hybridwork::schema::secp256k1_attestor_id& attestor,
                      const hybridwork::schema::secp256k1_signature_t& proof) {
  auto compact = compact_secp_proof(proof);
  if (!compact.has_value()) {
    return false;
  }
  auto der = to_der(*compact);
  if (!der.has_value()) {
    return false;
  }
  auto pkey = load_secp256k1_key(attestor);
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey.get(), EVP_sha256(), der->data(), der->size(),
                       message);
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                               EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_proof(const hybridwork::schema::bytes_view_t& message,
                  const hybridwork::schema::attestor_id_t& attestor,
                  const hybridwork::schema::proof_t& proof) {
  return std::visit(
      overloaded{
          [&](const hybridwork::schema::ed25519_attestor_id& key) {
            const auto* signature =
                std::get_if<hybridwork::schema::ed25519_signature_t>(&proof);
            return signature != nullptr &&
                   verify_ed25519(message, key, *signature);
          },
          [&](const hybridwork::schema::secp256k1_attestor_id& key) {
            const auto* signature =
                std::get_if<hybridwork::schema::secp256k1_signature_t>(&proof);
            return signature != nullptr &&
                   verify_secp256k1(message, key, *signature);
          }},
      attestor);
}

}  // namespace hybridwork::crypto
