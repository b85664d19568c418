#pragma once

#include <tessera/token/ledger.hpp>

namespace tessera::token {

/// Owner-only issuance. Rejected before any mutation when total_supply +
/// amount would exceed max_supply.
outcome_t mint(tessera::schema::token_state_t& state,
               const tessera::schema::account_id_t& caller,
               const tessera::schema::account_id_t& to,
               const tessera::schema::amount_t& amount,
               events_t& events);

/// Owner-only; destroys units from the caller's own balance.
outcome_t burn(tessera::schema::token_state_t& state,
               const tessera::schema::account_id_t& caller,
               const tessera::schema::amount_t& amount,
               events_t& events);

tessera::schema::amount_t remaining_supply(
    const tessera::schema::token_state_t& state);

}  // namespace tessera::token
