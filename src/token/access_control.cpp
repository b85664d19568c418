#include <tessera/token/access_control.hpp>

using namespace tessera::schema;

namespace tessera::token {

outcome_t require_owner(const token_state_t& state,
                        const account_id_t& caller) {
  if (!state.owner.has_value() || state.owner.value() != caller) {
    return transaction_error_code::authorization_denied;
  }
  return std::nullopt;
}

std::optional<account_id_t> owner(const token_state_t& state) {
  return state.owner;
}

outcome_t transfer_ownership(token_state_t& state,
                             const account_id_t& caller,
                             const account_id_t& new_owner,
                             events_t& events) {
  if (auto denied = require_owner(state, caller)) {
    return denied;
  }
  if (is_null_account(new_owner)) {
    return transaction_error_code::null_owner;
  }
  auto previous = state.owner;
  state.owner = new_owner;
  events.push_back(ownership_transferred_event{.previous_owner = previous,
                                               .new_owner = new_owner});
  return std::nullopt;
}

outcome_t renounce_ownership(token_state_t& state,
                             const account_id_t& caller,
                             events_t& events) {
  if (auto denied = require_owner(state, caller)) {
    return denied;
  }
  auto previous = state.owner;
  state.owner.reset();
  events.push_back(ownership_transferred_event{.previous_owner = previous,
                                               .new_owner = std::nullopt});
  return std::nullopt;
}

}  // namespace tessera::token
