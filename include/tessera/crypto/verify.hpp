#pragma once

#include <tessera/schema/primitives.hpp>

namespace tessera::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// Verify signature over message for a key signer. ed25519 signs the message
/// directly; secp256k1 is ECDSA over SHA-256 with a 65-byte [r || s || v]
/// signature. Named signers carry no key and never verify.
bool verify_signature(const tessera::schema::bytes_view_t& message,
                      const tessera::schema::signer_id_t& signer,
                      const tessera::schema::signature_t& signature);

}  // namespace tessera::crypto
