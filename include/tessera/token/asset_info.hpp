#pragma once

#include <tessera/token/ledger.hpp>

#include <string>
#include <string_view>

namespace tessera::token {

outcome_t set_asset_info(tessera::schema::token_state_t& state,
                         const tessera::schema::account_id_t& caller,
                         const std::string_view uri,
                         events_t& events);

const std::string& asset_info(const tessera::schema::token_state_t& state);

}  // namespace tessera::token
