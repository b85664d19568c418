#include <tessera/token/access_control.hpp>
#include <tessera/token/operational_switch.hpp>

using namespace tessera::schema;

namespace tessera::token {

outcome_t require_active(const token_state_t& state) {
  if (state.state != operational_state_t::active) {
    return transaction_error_code::operation_halted;
  }
  return std::nullopt;
}

bool is_paused(const token_state_t& state) {
  return state.state == operational_state_t::halted;
}

outcome_t pause(token_state_t& state,
                const account_id_t& caller,
                events_t& events) {
  if (auto denied = require_owner(state, caller)) {
    return denied;
  }
  if (state.state == operational_state_t::halted) {
    return transaction_error_code::already_paused;
  }
  state.state = operational_state_t::halted;
  events.push_back(paused_event{.account = caller});
  return std::nullopt;
}

outcome_t unpause(token_state_t& state,
                  const account_id_t& caller,
                  events_t& events) {
  if (auto denied = require_owner(state, caller)) {
    return denied;
  }
  if (state.state != operational_state_t::halted) {
    return transaction_error_code::not_paused;
  }
  state.state = operational_state_t::active;
  events.push_back(unpaused_event{.account = caller});
  return std::nullopt;
}

}  // namespace tessera::token
