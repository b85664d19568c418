#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction.hpp>

namespace tessera::crypto {

/// Ledger account controlled by signer. A named signer is its own account;
/// a key signer's account is the BLAKE3 digest of its public key bytes.
tessera::schema::account_id_t account_of(
    const tessera::schema::signer_id_t& signer);

/// Bytes covered by the transaction signature: the SCALE encoding of
/// (version, chain_id, nonce, signer, payload).
tessera::schema::bytes_t signing_bytes(
    const tessera::schema::transaction_t& transaction);

}  // namespace tessera::crypto
