#pragma once

#include <tessera/schema/genesis.hpp>
#include <tessera/schema/transaction.hpp>
#include <tessera/token/access_control.hpp>
#include <tessera/token/asset_info.hpp>
#include <tessera/token/ledger.hpp>
#include <tessera/token/operational_switch.hpp>
#include <tessera/token/supply.hpp>

namespace tessera::token {

/// Build a fresh token from construction parameters. Credits the whole
/// initial supply to the creator and makes the creator the owner. On failure
/// state and events are left untouched.
outcome_t initialize(tessera::schema::token_state_t& state,
                     const tessera::schema::genesis_t& genesis,
                     events_t& events);

/// Route a decoded payload to the operation it names, on behalf of caller.
outcome_t apply(tessera::schema::token_state_t& state,
                const tessera::schema::account_id_t& caller,
                const tessera::schema::transaction_payload_t& payload,
                events_t& events);

}  // namespace tessera::token
