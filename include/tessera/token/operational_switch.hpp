#pragma once

#include <tessera/token/ledger.hpp>

namespace tessera::token {

outcome_t require_active(const tessera::schema::token_state_t& state);

bool is_paused(const tessera::schema::token_state_t& state);

outcome_t pause(tessera::schema::token_state_t& state,
                const tessera::schema::account_id_t& caller,
                events_t& events);

outcome_t unpause(tessera::schema::token_state_t& state,
                  const tessera::schema::account_id_t& caller,
                  events_t& events);

}  // namespace tessera::token
