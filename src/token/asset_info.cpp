#include <tessera/token/access_control.hpp>
#include <tessera/token/asset_info.hpp>

using namespace tessera::schema;

namespace tessera::token {

outcome_t set_asset_info(token_state_t& state,
                         const account_id_t& caller,
                         const std::string_view uri,
                         events_t& events) {
  if (auto denied = require_owner(state, caller)) {
    return denied;
  }
  state.asset_info = std::string{uri};
  events.push_back(asset_info_updated_event{.uri = state.asset_info,
                                            .updated_by = caller});
  return std::nullopt;
}

const std::string& asset_info(const token_state_t& state) {
  return state.asset_info;
}

}  // namespace tessera::token
