#include <gtest/gtest.h>
#include <tessera/execution/engine.hpp>

TEST(engine_types, defaults_are_stable) {
  auto tx = tessera::schema::transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_EQ(tx.gas_wanted, 0);
  EXPECT_EQ(tx.gas_used, 0);
  EXPECT_TRUE(tx.events.empty());

  auto block = tessera::schema::block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());

  auto commit = tessera::schema::commit_result_t{};
  EXPECT_EQ(commit.retain_height, 0);
  EXPECT_EQ(commit.committed_height, 0);

  auto info = tessera::schema::app_info_t{};
  EXPECT_EQ(info.data, "tessera-ledger");
  EXPECT_EQ(info.version, "0.1.0");
  EXPECT_EQ(info.app_version, 1u);
}

TEST(engine_types, token_state_starts_active_and_empty) {
  auto state = tessera::schema::token_state_t{};
  EXPECT_EQ(state.state, tessera::schema::operational_state_t::active);
  EXPECT_EQ(state.decimals, 18);
  EXPECT_FALSE(state.owner.has_value());
  EXPECT_TRUE(state.balances.empty());
  EXPECT_TRUE(state.allowances.empty());
}

TEST(engine_types, verifier_callback_type_compiles) {
  auto verifier = tessera::execution::signature_verifier_t{
      [](const tessera::schema::bytes_view_t&,
         const tessera::schema::signer_id_t&,
         const tessera::schema::signature_t&) { return true; }};
  EXPECT_TRUE(static_cast<bool>(verifier));
}
