#pragma once

#include <tessera/schema/operational_state.hpp>
#include <tessera/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace tessera::schema {

using allowance_key_t = std::pair<account_id_t, account_id_t>;

/// Complete in-memory record of the token: metadata, supply bookkeeping,
/// governance fields and the balance and allowance tables.
///
/// Zero balances and zero allowances are never stored; a missing entry reads
/// as zero.
template <uint16_t Version>
struct token_state;

template <>
struct token_state<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  uint8_t decimals{kTokenDecimals};
  amount_t total_supply{0};
  amount_t max_supply{0};
  std::optional<account_id_t> owner;
  operational_state_t state{operational_state_t::active};
  std::string asset_info;
  std::map<account_id_t, amount_t> balances;
  std::map<allowance_key_t, amount_t> allowances;
};

using token_state_t = token_state<1>;

/// Persisted token row: everything in token_state except the balance and
/// allowance tables, which are stored one row per entry.
template <uint16_t Version>
struct token_record;

template <>
struct token_record<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  uint8_t decimals{kTokenDecimals};
  amount_t total_supply{0};
  amount_t max_supply{0};
  std::optional<account_id_t> owner;
  operational_state_t state{operational_state_t::active};
  std::string asset_info;
};

using token_record_t = token_record<1>;

}  // namespace tessera::schema
