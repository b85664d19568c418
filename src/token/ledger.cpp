#include <tessera/token/ledger.hpp>
#include <tessera/token/operational_switch.hpp>

#include <iterator>

using namespace tessera::schema;

namespace tessera::token {

namespace {

void store_balance(token_state_t& state,
                   const account_id_t& account,
                   const amount_t& amount) {
  if (amount == 0) {
    state.balances.erase(account);
    return;
  }
  state.balances[account] = amount;
}

void store_allowance(token_state_t& state,
                     const account_id_t& owner,
                     const account_id_t& spender,
                     const amount_t& amount) {
  auto key = allowance_key_t{owner, spender};
  if (amount == 0) {
    state.allowances.erase(key);
    return;
  }
  state.allowances[key] = amount;
}

}  // namespace

amount_t balance_of(const token_state_t& state, const account_id_t& account) {
  auto it = state.balances.find(account);
  if (it == std::end(state.balances)) {
    return 0;
  }
  return it->second;
}

amount_t allowance(const token_state_t& state,
                   const account_id_t& owner,
                   const account_id_t& spender) {
  auto it = state.allowances.find(allowance_key_t{owner, spender});
  if (it == std::end(state.allowances)) {
    return 0;
  }
  return it->second;
}

outcome_t move_balance(token_state_t& state,
                       const std::optional<account_id_t>& from,
                       const std::optional<account_id_t>& to,
                       const amount_t& amount,
                       events_t& events) {
  if (auto halted = require_active(state)) {
    return halted;
  }
  if (from.has_value() && balance_of(state, *from) < amount) {
    return transaction_error_code::insufficient_balance;
  }

  // Debit before credit so a self-transfer nets to zero.
  if (from.has_value()) {
    store_balance(state, *from, balance_of(state, *from) - amount);
  } else {
    state.total_supply += amount;
  }
  if (to.has_value()) {
    store_balance(state, *to, balance_of(state, *to) + amount);
  } else {
    state.total_supply -= amount;
  }

  events.push_back(transfer_event{.from = from.value_or(make_null_account()),
                                  .to = to.value_or(make_null_account()),
                                  .amount = amount});
  return std::nullopt;
}

outcome_t transfer(token_state_t& state,
                   const account_id_t& caller,
                   const account_id_t& to,
                   const amount_t& amount,
                   events_t& events) {
  if (auto halted = require_active(state)) {
    return halted;
  }
  if (is_null_account(to)) {
    return transaction_error_code::null_recipient;
  }
  return move_balance(state, caller, to, amount, events);
}

outcome_t approve(token_state_t& state,
                  const account_id_t& caller,
                  const account_id_t& spender,
                  const amount_t& amount,
                  events_t& events) {
  if (auto halted = require_active(state)) {
    return halted;
  }
  if (is_null_account(spender)) {
    return transaction_error_code::null_spender;
  }
  store_allowance(state, caller, spender, amount);
  events.push_back(
      approval_event{.owner = caller, .spender = spender, .amount = amount});
  return std::nullopt;
}

outcome_t transfer_from(token_state_t& state,
                        const account_id_t& caller,
                        const account_id_t& from,
                        const account_id_t& to,
                        const amount_t& amount,
                        events_t& events) {
  if (auto halted = require_active(state)) {
    return halted;
  }
  if (is_null_account(from)) {
    return transaction_error_code::null_owner;
  }
  if (is_null_account(to)) {
    return transaction_error_code::null_recipient;
  }
  auto current = allowance(state, from, caller);
  auto unlimited = current == kUnlimitedAllowance;
  if (!unlimited && current < amount) {
    return transaction_error_code::insufficient_allowance;
  }
  if (auto failed = move_balance(state, from, to, amount, events)) {
    return failed;
  }
  if (!unlimited) {
    store_allowance(state, from, caller, current - amount);
  }
  return std::nullopt;
}

amount_t total_balance(const token_state_t& state) {
  auto total = amount_t{0};
  for (const auto& [account, balance] : state.balances) {
    total += balance;
  }
  return total;
}

}  // namespace tessera::token
