#include <tessera/schema/key/engine_keys.hpp>

#include <tessera/schema/encoding/scale/encoder.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <iterator>
#include <tuple>

namespace tessera::schema::key {

namespace {

using key_encoder_t = tessera::schema::encoding::scale_encoder_t;

bool has_prefix(const tessera::schema::bytes_view_t& key,
                const std::string_view prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                    [](const char lhs, const uint8_t rhs) {
                      return static_cast<uint8_t>(lhs) == rhs;
                    });
}

template <typename T>
std::optional<T> decode_suffix(const tessera::schema::bytes_view_t& key,
                               const std::string_view prefix) {
  if (!has_prefix(key, prefix)) {
    return std::nullopt;
  }
  auto suffix = key.subspan(prefix.size());
  auto decoded = key_encoder_t{}.try_decode<T>(suffix);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  // Reject trailing bytes so that one key never parses as two ids.
  if (key_encoder_t{}.encode(decoded.value()).size() != suffix.size()) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace

tessera::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                           const tessera::schema::bytes_t& id) {
  auto key = tessera::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

tessera::schema::bytes_t make_token_key() {
  return tessera::schema::make_bytes(kTokenKey);
}

tessera::schema::bytes_t make_balance_key(
    const tessera::schema::account_id_t& account) {
  return make_prefixed_key(kBalanceKeyPrefix, key_encoder_t{}.encode(account));
}

tessera::schema::bytes_t make_allowance_key(
    const tessera::schema::account_id_t& owner,
    const tessera::schema::account_id_t& spender) {
  return make_prefixed_key(kAllowanceKeyPrefix,
                           key_encoder_t{}.encode(std::tuple{owner, spender}));
}

tessera::schema::bytes_t make_nonce_key(
    const tessera::schema::account_id_t& account) {
  return make_prefixed_key(kNonceKeyPrefix, key_encoder_t{}.encode(account));
}

tessera::schema::bytes_t make_history_key(const uint64_t height,
                                          const uint32_t index) {
  auto suffix = tessera::schema::bytes_t(sizeof(height) + sizeof(index));
  boost::endian::store_big_u64(suffix.data(), height);
  boost::endian::store_big_u32(suffix.data() + sizeof(height), index);
  return make_prefixed_key(kHistoryPrefix, suffix);
}

tessera::schema::bytes_t make_chain_id_key() {
  return tessera::schema::make_bytes(kChainIdKey);
}

std::optional<tessera::schema::account_id_t> parse_balance_key(
    const tessera::schema::bytes_view_t& key) {
  return decode_suffix<tessera::schema::account_id_t>(key, kBalanceKeyPrefix);
}

std::optional<std::pair<tessera::schema::account_id_t,
                        tessera::schema::account_id_t>>
parse_allowance_key(const tessera::schema::bytes_view_t& key) {
  auto decoded = decode_suffix<std::tuple<tessera::schema::account_id_t,
                                          tessera::schema::account_id_t>>(
      key, kAllowanceKeyPrefix);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  return std::pair{std::get<0>(decoded.value()), std::get<1>(decoded.value())};
}

std::optional<tessera::schema::account_id_t> parse_nonce_key(
    const tessera::schema::bytes_view_t& key) {
  return decode_suffix<tessera::schema::account_id_t>(key, kNonceKeyPrefix);
}

std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    const tessera::schema::bytes_view_t& key) {
  if (!has_prefix(key, kHistoryPrefix) ||
      key.size() != kHistoryPrefix.size() + sizeof(uint64_t) +
                        sizeof(uint32_t)) {
    return std::nullopt;
  }
  auto* suffix = key.data() + kHistoryPrefix.size();
  return std::pair<uint64_t, uint32_t>{
      boost::endian::load_big_u64(suffix),
      boost::endian::load_big_u32(suffix + sizeof(uint64_t))};
}

}  // namespace tessera::schema::key
