#include <tessera/token/token.hpp>

#include <iterator>
#include <utility>

using namespace tessera::schema;

namespace tessera::token {

outcome_t initialize(token_state_t& state,
                     const genesis_t& genesis,
                     events_t& events) {
  if (genesis.initial_supply > genesis.max_supply) {
    return transaction_error_code::initial_supply_exceeds_cap;
  }
  if (is_null_account(genesis.creator)) {
    return transaction_error_code::null_creator;
  }

  auto created = token_state_t{};
  created.name = genesis.name;
  created.symbol = genesis.symbol;
  created.max_supply = genesis.max_supply;
  created.owner = genesis.creator;

  auto emitted = events_t{};
  emitted.push_back(ownership_transferred_event{
      .previous_owner = std::nullopt, .new_owner = genesis.creator});
  if (auto failed = move_balance(created, std::nullopt, genesis.creator,
                                 genesis.initial_supply, emitted)) {
    return failed;
  }

  state = std::move(created);
  events.insert(std::end(events), std::make_move_iterator(std::begin(emitted)),
                std::make_move_iterator(std::end(emitted)));
  return std::nullopt;
}

outcome_t apply(token_state_t& state,
                const account_id_t& caller,
                const transaction_payload_t& payload,
                events_t& events) {
  return std::visit(
      overloaded{
          [&](const transfer_t& value) {
            return transfer(state, caller, value.to, value.amount, events);
          },
          [&](const approve_t& value) {
            return approve(state, caller, value.spender, value.amount, events);
          },
          [&](const transfer_from_t& value) {
            return transfer_from(state, caller, value.from, value.to,
                                 value.amount, events);
          },
          [&](const mint_t& value) {
            return mint(state, caller, value.to, value.amount, events);
          },
          [&](const burn_t& value) {
            return burn(state, caller, value.amount, events);
          },
          [&](const pause_t&) { return pause(state, caller, events); },
          [&](const unpause_t&) { return unpause(state, caller, events); },
          [&](const set_asset_info_t& value) {
            return set_asset_info(state, caller, value.uri, events);
          },
          [&](const transfer_ownership_t& value) {
            return transfer_ownership(state, caller, value.new_owner, events);
          },
          [&](const renounce_ownership_t&) {
            return renounce_ownership(state, caller, events);
          }},
      payload);
}

}  // namespace tessera::token
