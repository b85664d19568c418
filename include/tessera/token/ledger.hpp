#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/token_event.hpp>
#include <tessera/schema/token_state.hpp>
#include <tessera/schema/transaction_error_code.hpp>

#include <optional>
#include <vector>

namespace tessera::token {

/// std::nullopt on success, otherwise the reason the operation was rejected.
/// A rejected operation never mutates the state.
using outcome_t = std::optional<tessera::schema::transaction_error_code>;
using events_t = std::vector<tessera::schema::token_event_t>;

tessera::schema::amount_t balance_of(
    const tessera::schema::token_state_t& state,
    const tessera::schema::account_id_t& account);

tessera::schema::amount_t allowance(
    const tessera::schema::token_state_t& state,
    const tessera::schema::account_id_t& owner,
    const tessera::schema::account_id_t& spender);

/// Shared credit/debit primitive behind transfer, transfer_from, mint and
/// burn. An absent `from` issues new units (total supply grows), an absent
/// `to` destroys them (total supply shrinks). Fails with operation_halted
/// while the token is halted and with insufficient_balance when `from` cannot
/// cover the amount. Emits a transfer event, using the null account for the
/// absent side.
outcome_t move_balance(tessera::schema::token_state_t& state,
                       const std::optional<tessera::schema::account_id_t>& from,
                       const std::optional<tessera::schema::account_id_t>& to,
                       const tessera::schema::amount_t& amount,
                       events_t& events);

outcome_t transfer(tessera::schema::token_state_t& state,
                   const tessera::schema::account_id_t& caller,
                   const tessera::schema::account_id_t& to,
                   const tessera::schema::amount_t& amount,
                   events_t& events);

/// Overwrites the allowance; it does not add to it. Setting the unlimited
/// value makes the allowance non-consuming.
outcome_t approve(tessera::schema::token_state_t& state,
                  const tessera::schema::account_id_t& caller,
                  const tessera::schema::account_id_t& spender,
                  const tessera::schema::amount_t& amount,
                  events_t& events);

outcome_t transfer_from(tessera::schema::token_state_t& state,
                        const tessera::schema::account_id_t& caller,
                        const tessera::schema::account_id_t& from,
                        const tessera::schema::account_id_t& to,
                        const tessera::schema::amount_t& amount,
                        events_t& events);

/// Sum of every stored balance. Equal to total_supply in any state reachable
/// through this module.
tessera::schema::amount_t total_balance(
    const tessera::schema::token_state_t& state);

}  // namespace tessera::token
