#include <gtest/gtest.h>
#include <tessera/schema/operational_state.hpp>
#include <tessera/schema/transaction_error_code.hpp>

using tessera::schema::error_kind_of;
using tessera::schema::error_kind_t;
using tessera::schema::transaction_error_code;

TEST(error_code, envelope_codes_map_to_envelope_kind) {
  for (auto code : {transaction_error_code::invalid_transaction,
                    transaction_error_code::unsupported_transaction_version,
                    transaction_error_code::invalid_chain_id,
                    transaction_error_code::invalid_nonce,
                    transaction_error_code::invalid_signature_type,
                    transaction_error_code::signature_verification_failed,
                    transaction_error_code::token_uninitialized}) {
    EXPECT_EQ(error_kind_of(code), error_kind_t::envelope)
        << tessera::schema::to_string(code);
  }
}

TEST(error_code, token_codes_map_to_their_kind) {
  EXPECT_EQ(error_kind_of(transaction_error_code::authorization_denied),
            error_kind_t::authorization);
  EXPECT_EQ(error_kind_of(transaction_error_code::operation_halted),
            error_kind_t::state);
  EXPECT_EQ(error_kind_of(transaction_error_code::token_already_initialized),
            error_kind_t::state);
  EXPECT_EQ(error_kind_of(transaction_error_code::insufficient_allowance),
            error_kind_t::insufficient_funds);
  EXPECT_EQ(error_kind_of(transaction_error_code::supply_cap_exceeded),
            error_kind_t::supply_cap);
  EXPECT_EQ(error_kind_of(transaction_error_code::null_spender),
            error_kind_t::invalid_argument);
  EXPECT_EQ(error_kind_of(transaction_error_code::null_creator),
            error_kind_t::invalid_argument);
  EXPECT_EQ(error_kind_of(transaction_error_code::not_paused),
            error_kind_t::invalid_transition);
}

TEST(error_code, names_are_stable) {
  EXPECT_EQ(tessera::schema::to_string(transaction_error_code::invalid_nonce),
            "invalid_nonce");
  EXPECT_EQ(
      tessera::schema::to_string(transaction_error_code::supply_cap_exceeded),
      "supply_cap_exceeded");
  EXPECT_EQ(tessera::schema::to_string(static_cast<transaction_error_code>(99)),
            "unknown");
  EXPECT_EQ(static_cast<uint32_t>(transaction_error_code::invalid_transaction),
            1u);
  EXPECT_EQ(static_cast<uint32_t>(transaction_error_code::not_paused), 21u);
}

TEST(error_code, every_mapping_is_unique) {
  const auto& mappings = tessera::schema::kTransactionErrorCodeMappings;
  for (std::size_t i = 0; i < mappings.size(); ++i) {
    for (std::size_t j = i + 1; j < mappings.size(); ++j) {
      EXPECT_NE(mappings[i].first, mappings[j].first);
      EXPECT_NE(mappings[i].second, mappings[j].second);
    }
  }
}

TEST(operational_state, parses_from_string) {
  EXPECT_EQ(
      tessera::schema::try_from_string<tessera::schema::operational_state_t>(
          "halted"),
      tessera::schema::operational_state_t::halted);
  EXPECT_FALSE(
      tessera::schema::try_from_string<tessera::schema::operational_state_t>(
          "paused"));
  EXPECT_EQ(
      tessera::schema::to_string(tessera::schema::operational_state_t::active),
      "active");
}
