#pragma once

#include <tessera/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for token state, signer nonces and
// transaction history. Keys are the raw prefix bytes followed by the encoded
// identifier so that prefix scans stay ordered.
namespace tessera::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kTokenKey{"SYS|STATE|TOKEN"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kAllowanceKeyPrefix{"SYS|STATE|ALLOWANCE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kChainIdKey{"SYS|APP|CHAIN_ID"};

tessera::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                           const tessera::schema::bytes_t& id);

tessera::schema::bytes_t make_token_key();

tessera::schema::bytes_t make_balance_key(
    const tessera::schema::account_id_t& account);

tessera::schema::bytes_t make_allowance_key(
    const tessera::schema::account_id_t& owner,
    const tessera::schema::account_id_t& spender);

tessera::schema::bytes_t make_nonce_key(
    const tessera::schema::account_id_t& account);

/// History keys use big-endian height and index so that lexicographic
/// RocksDB order is (height, index) order.
tessera::schema::bytes_t make_history_key(uint64_t height, uint32_t index);

tessera::schema::bytes_t make_chain_id_key();

std::optional<tessera::schema::account_id_t> parse_balance_key(
    const tessera::schema::bytes_view_t& key);

std::optional<std::pair<tessera::schema::account_id_t,
                        tessera::schema::account_id_t>>
parse_allowance_key(const tessera::schema::bytes_view_t& key);

std::optional<tessera::schema::account_id_t> parse_nonce_key(
    const tessera::schema::bytes_view_t& key);

std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    const tessera::schema::bytes_view_t& key);

}  // namespace tessera::schema::key
