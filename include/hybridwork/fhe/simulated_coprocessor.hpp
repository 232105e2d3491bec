#pragma once

#include <hybridwork/crypto/signer.hpp>
#include <hybridwork/fhe/coprocessor.hpp>
#include <hybridwork/schema/primitives.hpp>

#include <cstdint>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace hybridwork::fhe {

/// Plaintext simulation of the co-processor capability.
///
/// Values are kept in a table keyed by handle; handles are BLAKE3 digests of
/// the operation and its operand handles, so the engine sees the same opaque
/// references a real backend would hand out. Decryption results are signed
/// with a per-instance Ed25519 key. Not a cryptosystem: used by tests and the
/// command line simulator.
class simulated_coprocessor final : public coprocessor {
 public:
  simulated_coprocessor();

  using coprocessor::add;
  using coprocessor::gt;
  using coprocessor::mul;
  using coprocessor::sub;

  ciphertext encrypt(uint32_t constant) override;
  ciphertext add(const ciphertext& lhs, const ciphertext& rhs) override;
  ciphertext sub(const ciphertext& lhs, const ciphertext& rhs) override;
  ciphertext mul(const ciphertext& lhs, const ciphertext& rhs) override;
  ciphertext div(const ciphertext& lhs, const ciphertext& rhs) override;
  ciphertext div(const ciphertext& lhs, uint32_t divisor) override;
  ciphertext abs(const ciphertext& value) override;
  ciphertext bit_and(const ciphertext& lhs, const ciphertext& rhs) override;
  ciphertext gt(const ciphertext& lhs, const ciphertext& rhs) override;
  ciphertext select(const ciphertext& condition,
                    const ciphertext& when_true,
                    const ciphertext& when_false) override;
  hybridwork::schema::bytes_t serialize(const ciphertext& value) override;
  hybridwork::schema::request_id_t request_decryption(
      const std::vector<hybridwork::schema::bytes_t>& ciphertexts) override;

  /// Client-side encryption of an input. Unlike `encrypt`, equal values get
  /// distinct handles.
  ciphertext encrypt_input(uint32_t value);

  /// Key the engine must trust for decryption proofs.
  hybridwork::schema::attestor_id_t attestor() const;

  /// Produce the callback for a queued request and drop it from the queue.
  std::optional<decryption_response> fulfil(
      const hybridwork::schema::request_id_t& request_id);

  std::vector<hybridwork::schema::request_id_t> pending_requests() const;

 private:
  ciphertext store(std::string_view operation,
                   std::initializer_list<const ciphertext*> operands,
                   uint64_t salt,
                   uint32_t value);
  uint32_t value_of(const ciphertext& value) const;

  mutable std::mutex mutex_;
  std::map<hybridwork::schema::handle_id_t, uint32_t> values_;
  std::map<hybridwork::schema::request_id_t,
           std::vector<hybridwork::schema::handle_id_t>>
      jobs_;
  uint64_t input_nonce_{};
  uint64_t request_nonce_{};
  hybridwork::crypto::ed25519_signer signer_;
};

}  // namespace hybridwork::fhe
