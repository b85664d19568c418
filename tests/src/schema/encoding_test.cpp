#include <gtest/gtest.h>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/genesis.hpp>
#include <tessera/schema/key/engine_keys.hpp>
#include <tessera/schema/token_state.hpp>
#include <tessera/schema/transaction.hpp>
#include <tessera/testing/common.hpp>

#include <algorithm>
#include <variant>
#include <vector>

using namespace tessera::testing;
using encoder_t = tessera::schema::encoding::scale_encoder_t;

TEST(encoding, transaction_preserves_payload_alternative) {
  auto encoder = encoder_t{};
  auto tx = tessera::schema::transaction_t{
      .version = 1,
      .chain_id = make_hash(3),
      .nonce = 42,
      .signer = make_named_signer(7),
      .payload = tessera::schema::transfer_from_t{.from = make_account(1),
                                                  .to = make_account(2),
                                                  .amount = amount(1234567)},
      .signature = tessera::schema::secp256k1_signature_t{}};

  auto decoded = encoder.decode<tessera::schema::transaction_t>(
      tessera::schema::make_bytes_view(encoder.encode(tx)));
  EXPECT_EQ(decoded.nonce, 42u);
  EXPECT_EQ(decoded.chain_id, make_hash(3));
  EXPECT_TRUE(std::holds_alternative<tessera::schema::named_signer_t>(
      decoded.signer));
  EXPECT_TRUE(std::holds_alternative<tessera::schema::secp256k1_signature_t>(
      decoded.signature));
  const auto* payload =
      std::get_if<tessera::schema::transfer_from_t>(&decoded.payload);
  ASSERT_NE(payload, nullptr);
  EXPECT_EQ(payload->from, make_account(1));
  EXPECT_EQ(payload->to, make_account(2));
  EXPECT_EQ(payload->amount, 1234567);
}

TEST(encoding, amounts_keep_all_256_bits) {
  auto encoder = encoder_t{};
  auto genesis = tessera::schema::genesis_t{
      .name = "Max",
      .symbol = "MAX",
      .initial_supply = tessera::schema::kUnlimitedAllowance,
      .max_supply = tessera::schema::kUnlimitedAllowance,
      .creator = make_account(1)};
  auto decoded = encoder.decode<tessera::schema::genesis_t>(
      tessera::schema::make_bytes_view(encoder.encode(genesis)));
  EXPECT_EQ(decoded.initial_supply, tessera::schema::kUnlimitedAllowance);
  EXPECT_EQ(decoded.name, "Max");
}

TEST(encoding, try_decode_rejects_truncated_input) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(tessera::schema::genesis_t{
      .name = "Tessera", .symbol = "TSR", .creator = make_account(1)});
  bytes.resize(bytes.size() / 2);
  EXPECT_FALSE(encoder.try_decode<tessera::schema::genesis_t>(
                   tessera::schema::make_bytes_view(bytes))
                   .has_value());
}

TEST(encoding, token_record_persists_operational_state) {
  auto encoder = encoder_t{};
  auto record = tessera::schema::token_record_t{
      .name = "Tessera",
      .symbol = "TSR",
      .total_supply = amount(10),
      .max_supply = amount(20),
      .owner = std::nullopt,
      .state = tessera::schema::operational_state_t::halted,
      .asset_info = "ipfs://x"};
  auto decoded = encoder.decode<tessera::schema::token_record_t>(
      tessera::schema::make_bytes_view(encoder.encode(record)));
  EXPECT_EQ(decoded.state, tessera::schema::operational_state_t::halted);
  EXPECT_FALSE(decoded.owner.has_value());
  EXPECT_EQ(decoded.asset_info, "ipfs://x");
  EXPECT_EQ(decoded.decimals, tessera::schema::kTokenDecimals);
}

TEST(engine_keys, state_keys_share_the_state_prefix) {
  auto starts_with_state = [](const tessera::schema::bytes_t& key) {
    auto prefix = tessera::schema::make_bytes(tessera::schema::key::kStatePrefix);
    return key.size() > prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), key.begin());
  };
  EXPECT_TRUE(starts_with_state(tessera::schema::key::make_token_key()));
  EXPECT_TRUE(
      starts_with_state(tessera::schema::key::make_balance_key(make_account(1))));
  EXPECT_TRUE(starts_with_state(tessera::schema::key::make_allowance_key(
      make_account(1), make_account(2))));
  EXPECT_TRUE(
      starts_with_state(tessera::schema::key::make_nonce_key(make_account(1))));
  EXPECT_FALSE(starts_with_state(tessera::schema::key::make_history_key(1, 0)));
  EXPECT_FALSE(starts_with_state(tessera::schema::key::make_chain_id_key()));
}

TEST(engine_keys, balance_and_allowance_keys_parse_back) {
  auto balance = tessera::schema::key::make_balance_key(make_account(9));
  EXPECT_EQ(tessera::schema::key::parse_balance_key(
                tessera::schema::make_bytes_view(balance)),
            make_account(9));

  auto allowance =
      tessera::schema::key::make_allowance_key(make_account(1), make_account(2));
  auto parsed = tessera::schema::key::parse_allowance_key(
      tessera::schema::make_bytes_view(allowance));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->first, make_account(1));
  EXPECT_EQ(parsed->second, make_account(2));

  // A balance key is not an allowance or nonce key.
  EXPECT_FALSE(tessera::schema::key::parse_allowance_key(
      tessera::schema::make_bytes_view(balance)));
  EXPECT_FALSE(tessera::schema::key::parse_nonce_key(
      tessera::schema::make_bytes_view(balance)));

  balance.push_back(0);
  EXPECT_FALSE(tessera::schema::key::parse_balance_key(
      tessera::schema::make_bytes_view(balance)));
}

TEST(engine_keys, history_keys_sort_by_height_then_index) {
  auto keys = std::vector<tessera::schema::bytes_t>{
      tessera::schema::key::make_history_key(256, 0),
      tessera::schema::key::make_history_key(2, 1),
      tessera::schema::key::make_history_key(2, 0),
      tessera::schema::key::make_history_key(1, 300)};
  std::sort(keys.begin(), keys.end());

  auto order = std::vector<std::pair<uint64_t, uint32_t>>{};
  for (const auto& key : keys) {
    auto parsed = tessera::schema::key::parse_history_key(
        tessera::schema::make_bytes_view(key));
    ASSERT_TRUE(parsed.has_value());
    order.push_back(parsed.value());
  }
  auto expected = std::vector<std::pair<uint64_t, uint32_t>>{
      {1, 300}, {2, 0}, {2, 1}, {256, 0}};
  EXPECT_EQ(order, expected);
}
