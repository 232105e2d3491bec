#pragma once

#include <hybridwork/schema/primitives.hpp>

namespace hybridwork::crypto {

/// True when the linked OpenSSL exposes Ed25519 and secp256k1.
bool available();

/// Verify a co-processor proof over `message` against the attestor key.
///
/// Ed25519 proofs sign the raw message. secp256k1 proofs are ECDSA over
/// SHA-256 and accept either `[v || r || s]` or `[r || s || v]` layouts.
bool verify_proof(const hybridwork::schema::bytes_view_t& message,
                  const hybridwork::schema::attestor_id_t& attestor,
                  const hybridwork::schema::proof_t& proof);

}  // namespace hybridwork::crypto
