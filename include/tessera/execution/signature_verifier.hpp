#pragma once

#include <tessera/schema/primitives.hpp>
#include <functional>

namespace tessera::execution {

/// Signature check used by envelope validation; returns true when signature
/// over message was produced by signer.
using signature_verifier_t =
    std::function<bool(const tessera::schema::bytes_view_t& message,
                       const tessera::schema::signer_id_t& signer,
                       const tessera::schema::signature_t& signature)>;

}  // namespace tessera::execution
