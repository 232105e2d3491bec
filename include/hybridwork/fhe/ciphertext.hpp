#pragma once

#include <hybridwork/schema/primitives.hpp>

namespace hybridwork::fhe {

/// Opaque reference to an encrypted 32-bit unsigned integer.
///
/// A ciphertext carries no plaintext and no arithmetic; all operations go
/// through a `coprocessor`. The handle identifier is exposed only so the
/// reference can be persisted and correlated.
class ciphertext final {
 public:
  ciphertext() = default;
  explicit ciphertext(const hybridwork::schema::handle_id_t& handle)
      : handle_{handle} {}

  const hybridwork::schema::handle_id_t& handle() const { return handle_; }

  /// True for a default-constructed reference that names no ciphertext.
  bool empty() const { return hybridwork::schema::is_zero_hash(handle_); }

  friend bool operator==(const ciphertext&, const ciphertext&) = default;

 private:
  hybridwork::schema::handle_id_t handle_{};
};

}  // namespace hybridwork::fhe
