#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace tessera::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  token_uninitialized = 7,
  token_already_initialized = 8,
  authorization_denied = 10,
  operation_halted = 11,
  insufficient_balance = 12,
  insufficient_allowance = 13,
  supply_cap_exceeded = 14,
  null_recipient = 15,
  null_spender = 16,
  null_owner = 17,
  initial_supply_exceeds_cap = 18,
  null_creator = 19,
  already_paused = 20,
  not_paused = 21,
};

/// Failure taxonomy shared by every code.
enum class error_kind_t : uint8_t {
  envelope = 0,
  authorization = 1,
  state = 2,
  insufficient_funds = 3,
  supply_cap = 4,
  invalid_argument = 5,
  invalid_transition = 6,
};

inline constexpr error_kind_t error_kind_of(const transaction_error_code code) {
  switch (code) {
    case transaction_error_code::authorization_denied:
      return error_kind_t::authorization;
    case transaction_error_code::operation_halted:
    case transaction_error_code::token_already_initialized:
      return error_kind_t::state;
    case transaction_error_code::insufficient_balance:
    case transaction_error_code::insufficient_allowance:
      return error_kind_t::insufficient_funds;
    case transaction_error_code::supply_cap_exceeded:
      return error_kind_t::supply_cap;
    case transaction_error_code::null_recipient:
    case transaction_error_code::null_spender:
    case transaction_error_code::null_owner:
    case transaction_error_code::initial_supply_exceeds_cap:
    case transaction_error_code::null_creator:
      return error_kind_t::invalid_argument;
    case transaction_error_code::already_paused:
    case transaction_error_code::not_paused:
      return error_kind_t::invalid_transition;
    default:
      return error_kind_t::envelope;
  }
}

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_chain_id", transaction_error_code::invalid_chain_id},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_nonce", transaction_error_code::invalid_nonce},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_signature_type",
        transaction_error_code::invalid_signature_type},
    std::pair<std::string_view, transaction_error_code>{
        "signature_verification_failed",
        transaction_error_code::signature_verification_failed},
    std::pair<std::string_view, transaction_error_code>{
        "token_uninitialized", transaction_error_code::token_uninitialized},
    std::pair<std::string_view, transaction_error_code>{
        "token_already_initialized",
        transaction_error_code::token_already_initialized},
    std::pair<std::string_view, transaction_error_code>{
        "authorization_denied", transaction_error_code::authorization_denied},
    std::pair<std::string_view, transaction_error_code>{
        "operation_halted", transaction_error_code::operation_halted},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient_balance", transaction_error_code::insufficient_balance},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient_allowance",
        transaction_error_code::insufficient_allowance},
    std::pair<std::string_view, transaction_error_code>{
        "supply_cap_exceeded", transaction_error_code::supply_cap_exceeded},
    std::pair<std::string_view, transaction_error_code>{
        "null_recipient", transaction_error_code::null_recipient},
    std::pair<std::string_view, transaction_error_code>{
        "null_spender", transaction_error_code::null_spender},
    std::pair<std::string_view, transaction_error_code>{
        "null_owner", transaction_error_code::null_owner},
    std::pair<std::string_view, transaction_error_code>{
        "initial_supply_exceeds_cap",
        transaction_error_code::initial_supply_exceeds_cap},
    std::pair<std::string_view, transaction_error_code>{
        "null_creator", transaction_error_code::null_creator},
    std::pair<std::string_view, transaction_error_code>{
        "already_paused", transaction_error_code::already_paused},
    std::pair<std::string_view, transaction_error_code>{
        "not_paused", transaction_error_code::not_paused},
};

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

}  // namespace tessera::schema
