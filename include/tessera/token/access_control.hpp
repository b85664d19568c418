#pragma once

#include <tessera/token/ledger.hpp>

#include <optional>

namespace tessera::token {

/// The single authorization gate for administrative operations. Fails with
/// authorization_denied when the owner has been renounced or is not caller.
outcome_t require_owner(const tessera::schema::token_state_t& state,
                        const tessera::schema::account_id_t& caller);

std::optional<tessera::schema::account_id_t> owner(
    const tessera::schema::token_state_t& state);

outcome_t transfer_ownership(tessera::schema::token_state_t& state,
                             const tessera::schema::account_id_t& caller,
                             const tessera::schema::account_id_t& new_owner,
                             events_t& events);

/// Irreversible: once cleared, no account can pass require_owner again.
outcome_t renounce_ownership(tessera::schema::token_state_t& state,
                             const tessera::schema::account_id_t& caller,
                             events_t& events);

}  // namespace tessera::token
