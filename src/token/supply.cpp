#include <tessera/token/access_control.hpp>
#include <tessera/token/operational_switch.hpp>
#include <tessera/token/supply.hpp>

using namespace tessera::schema;

namespace tessera::token {

outcome_t mint(token_state_t& state,
               const account_id_t& caller,
               const account_id_t& to,
               const amount_t& amount,
               events_t& events) {
  if (auto denied = require_owner(state, caller)) {
    return denied;
  }
  if (auto halted = require_active(state)) {
    return halted;
  }
  if (is_null_account(to)) {
    return transaction_error_code::null_recipient;
  }
  if (amount > remaining_supply(state)) {
    return transaction_error_code::supply_cap_exceeded;
  }
  return move_balance(state, std::nullopt, to, amount, events);
}

outcome_t burn(token_state_t& state,
               const account_id_t& caller,
               const amount_t& amount,
               events_t& events) {
  if (auto denied = require_owner(state, caller)) {
    return denied;
  }
  if (auto halted = require_active(state)) {
    return halted;
  }
  return move_balance(state, caller, std::nullopt, amount, events);
}

amount_t remaining_supply(const token_state_t& state) {
  if (state.total_supply >= state.max_supply) {
    return 0;
  }
  return state.max_supply - state.total_supply;
}

}  // namespace tessera::token
