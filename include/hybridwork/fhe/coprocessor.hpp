#pragma once

#include <hybridwork/fhe/ciphertext.hpp>
#include <hybridwork/schema/primitives.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace hybridwork::fhe {

/// Raised by a co-processor when an operation is degenerate, e.g. a division
/// by an encrypted zero. Indicates malformed upstream data.
class arithmetic_error final : public std::runtime_error {
 public:
  explicit arithmetic_error(const std::string& what)
      : std::runtime_error{what} {}
};

/// Out-of-band decryption result delivered back to the engine.
struct decryption_response final {
  hybridwork::schema::request_id_t request_id{};
  hybridwork::schema::bytes_t payload;
  hybridwork::schema::proof_t proof;
};

/// Capability interface of the external FHE co-processor.
///
/// Arithmetic is over uint32 modulo 2^32. Every call returns a new handle and
/// never mutates its operands; identical inputs yield the identical handle.
class coprocessor {
 public:
  virtual ~coprocessor() = default;

  /// Trivially encrypt a public constant.
  virtual ciphertext encrypt(uint32_t constant) = 0;

  virtual ciphertext add(const ciphertext& lhs, const ciphertext& rhs) = 0;
  virtual ciphertext sub(const ciphertext& lhs, const ciphertext& rhs) = 0;
  virtual ciphertext mul(const ciphertext& lhs, const ciphertext& rhs) = 0;

  /// Truncating division. Throws `arithmetic_error` on a zero divisor.
  virtual ciphertext div(const ciphertext& lhs, const ciphertext& rhs) = 0;
  virtual ciphertext div(const ciphertext& lhs, uint32_t divisor) = 0;

  /// Magnitude of the value read as two's complement int32.
  virtual ciphertext abs(const ciphertext& value) = 0;
  virtual ciphertext bit_and(const ciphertext& lhs, const ciphertext& rhs) = 0;

  /// Encrypted boolean (0 or 1) of `lhs > rhs`.
  virtual ciphertext gt(const ciphertext& lhs, const ciphertext& rhs) = 0;

  /// `when_true` if `condition` is non-zero, otherwise `when_false`.
  virtual ciphertext select(const ciphertext& condition,
                            const ciphertext& when_true,
                            const ciphertext& when_false) = 0;

  virtual hybridwork::schema::bytes_t serialize(const ciphertext& value) = 0;

  /// Queue decryption of serialized ciphertexts. The result arrives later as
  /// a `decryption_response` carrying the returned identifier.
  virtual hybridwork::schema::request_id_t request_decryption(
      const std::vector<hybridwork::schema::bytes_t>& ciphertexts) = 0;

  ciphertext add(const ciphertext& lhs, const uint32_t rhs) {
    return add(lhs, encrypt(rhs));
  }
  ciphertext sub(const ciphertext& lhs, const uint32_t rhs) {
    return sub(lhs, encrypt(rhs));
  }
  ciphertext mul(const ciphertext& lhs, const uint32_t rhs) {
    return mul(lhs, encrypt(rhs));
  }
  ciphertext gt(const ciphertext& lhs, const uint32_t rhs) {
    return gt(lhs, encrypt(rhs));
  }
};

}  // namespace hybridwork::fhe
