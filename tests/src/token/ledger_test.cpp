#include <gtest/gtest-spi.h>
#include <gtest/gtest.h>
#include <tessera/testing/token_fixture.hpp>
#include <tessera/token/ledger.hpp>
#include <tessera/token/operational_switch.hpp>

using namespace tessera::testing;
using tessera::schema::transaction_error_code;

TEST(ledger, balance_of_unknown_account_is_zero) {
  auto token = token_fixture{1000, 5000};
  EXPECT_EQ(tessera::token::balance_of(token.state, make_account(9)), 0);
  EXPECT_EQ(tessera::token::balance_of(token.state, token.owner), 1000);
}

TEST(ledger, transfer_of_exact_balance_leaves_zero) {
  auto token = token_fixture{1000, 5000};
  auto to = make_account(2);

  auto failed = tessera::token::transfer(token.state, token.owner, to,
                                         amount(1000), token.events);
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(tessera::token::balance_of(token.state, token.owner), 0);
  EXPECT_EQ(tessera::token::balance_of(token.state, to), 1000);
  EXPECT_FALSE(token.state.balances.contains(token.owner));

  const auto& event = token.last_event<tessera::schema::transfer_event>();
  EXPECT_EQ(event.from, token.owner);
  EXPECT_EQ(event.to, to);
  EXPECT_EQ(event.amount, 1000);
  token.expect_supply_invariant();
}

TEST(ledger, transfer_of_one_over_balance_is_rejected_without_mutation) {
  auto token = token_fixture{1000, 5000};
  auto before = token.state.balances;

  auto failed = tessera::token::transfer(token.state, token.owner,
                                         make_account(2), amount(1001),
                                         token.events);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed.value(), transaction_error_code::insufficient_balance);
  EXPECT_EQ(tessera::schema::error_kind_of(failed.value()),
            tessera::schema::error_kind_t::insufficient_funds);
  EXPECT_EQ(token.state.balances, before);
  EXPECT_TRUE(token.events.empty());
}

TEST(ledger, transfer_to_null_account_is_rejected) {
  auto token = token_fixture{1000, 5000};
  auto failed = tessera::token::transfer(
      token.state, token.owner, tessera::schema::make_null_account(),
      amount(1), token.events);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed.value(), transaction_error_code::null_recipient);
  EXPECT_EQ(tessera::token::balance_of(token.state, token.owner), 1000);
}

TEST(ledger, transfer_to_self_keeps_balance) {
  auto token = token_fixture{1000, 5000};
  auto failed = tessera::token::transfer(token.state, token.owner, token.owner,
                                         amount(400), token.events);
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(tessera::token::balance_of(token.state, token.owner), 1000);
  token.expect_supply_invariant();
}

TEST(ledger, zero_transfer_succeeds_and_emits) {
  auto token = token_fixture{1000, 5000};
  auto failed = tessera::token::transfer(token.state, make_account(7),
                                         make_account(8), amount(0),
                                         token.events);
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(token.events.size(), 1u);
  EXPECT_FALSE(token.state.balances.contains(make_account(8)));
}

TEST(ledger, approve_overwrites_previous_allowance) {
  auto token = token_fixture{1000, 5000};
  auto spender = make_account(2);

  ASSERT_FALSE(tessera::token::approve(token.state, token.owner, spender,
                                       amount(100), token.events));
  EXPECT_EQ(tessera::token::allowance(token.state, token.owner, spender), 100);

  ASSERT_FALSE(tessera::token::approve(token.state, token.owner, spender,
                                       amount(30), token.events));
  EXPECT_EQ(tessera::token::allowance(token.state, token.owner, spender), 30);

  const auto& event = token.last_event<tessera::schema::approval_event>();
  EXPECT_EQ(event.owner, token.owner);
  EXPECT_EQ(event.spender, spender);
  EXPECT_EQ(event.amount, 30);

  ASSERT_FALSE(tessera::token::approve(token.state, token.owner, spender,
                                       amount(0), token.events));
  EXPECT_EQ(tessera::token::allowance(token.state, token.owner, spender), 0);
  EXPECT_TRUE(token.state.allowances.empty());
}

TEST(ledger, approve_null_spender_is_rejected) {
  auto token = token_fixture{1000, 5000};
  auto failed = tessera::token::approve(token.state, token.owner,
                                        tessera::schema::make_null_account(),
                                        amount(5), token.events);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed.value(), transaction_error_code::null_spender);
}

TEST(ledger, transfer_from_consumes_allowance) {
  auto token = token_fixture{1000, 5000};
  auto spender = make_account(2);
  auto recipient = make_account(3);
  ASSERT_FALSE(tessera::token::approve(token.state, token.owner, spender,
                                       amount(100), token.events));

  ASSERT_FALSE(tessera::token::transfer_from(token.state, spender, token.owner,
                                             recipient, amount(60),
                                             token.events));
  EXPECT_EQ(tessera::token::allowance(token.state, token.owner, spender), 40);
  EXPECT_EQ(tessera::token::balance_of(token.state, token.owner), 940);
  EXPECT_EQ(tessera::token::balance_of(token.state, recipient), 60);

  const auto& event = token.last_event<tessera::schema::transfer_event>();
  EXPECT_EQ(event.from, token.owner);
  EXPECT_EQ(event.to, recipient);

  auto failed = tessera::token::transfer_from(token.state, spender,
                                              token.owner, recipient,
                                              amount(41), token.events);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed.value(), transaction_error_code::insufficient_allowance);
  EXPECT_EQ(tessera::schema::error_kind_of(failed.value()),
            tessera::schema::error_kind_t::insufficient_funds);
  EXPECT_EQ(tessera::token::allowance(token.state, token.owner, spender), 40);
  token.expect_supply_invariant();
}

TEST(ledger, transfer_from_with_unlimited_allowance_is_not_decremented) {
  auto token = token_fixture{1000, 5000};
  auto spender = make_account(2);
  ASSERT_FALSE(tessera::token::approve(token.state, token.owner, spender,
                                       tessera::schema::kUnlimitedAllowance,
                                       token.events));

  ASSERT_FALSE(tessera::token::transfer_from(token.state, spender, token.owner,
                                             make_account(3), amount(700),
                                             token.events));
  EXPECT_EQ(tessera::token::allowance(token.state, token.owner, spender),
            tessera::schema::kUnlimitedAllowance);
}

TEST(ledger, transfer_from_with_allowance_above_balance_fails_on_balance) {
  auto token = token_fixture{1000, 5000};
  auto spender = make_account(2);
  ASSERT_FALSE(tessera::token::approve(token.state, token.owner, spender,
                                       amount(2000), token.events));

  auto failed = tessera::token::transfer_from(token.state, spender,
                                              token.owner, make_account(3),
                                              amount(1500), token.events);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed.value(), transaction_error_code::insufficient_balance);
  EXPECT_EQ(tessera::token::allowance(token.state, token.owner, spender),
            2000);
}

TEST(ledger, transfer_from_rejects_null_parties) {
  auto token = token_fixture{1000, 5000};
  auto spender = make_account(2);
  ASSERT_FALSE(tessera::token::approve(token.state, token.owner, spender,
                                       amount(10), token.events));

  auto null_to = tessera::token::transfer_from(
      token.state, spender, token.owner, tessera::schema::make_null_account(),
      amount(1), token.events);
  ASSERT_TRUE(null_to.has_value());
  EXPECT_EQ(null_to.value(), transaction_error_code::null_recipient);

  auto null_from = tessera::token::transfer_from(
      token.state, spender, tessera::schema::make_null_account(),
      make_account(3), amount(1), token.events);
  ASSERT_TRUE(null_from.has_value());
  EXPECT_EQ(null_from.value(), transaction_error_code::null_owner);
}

TEST(ledger, halted_token_blocks_transfer_approve_and_transfer_from) {
  auto token = token_fixture{1000, 5000};
  auto spender = make_account(2);
  ASSERT_FALSE(tessera::token::approve(token.state, token.owner, spender,
                                       amount(10), token.events));
  ASSERT_FALSE(tessera::token::pause(token.state, token.owner, token.events));
  token.events.clear();

  auto transfer = tessera::token::transfer(token.state, token.owner,
                                           make_account(3), amount(1),
                                           token.events);
  auto approve = tessera::token::approve(token.state, token.owner, spender,
                                         amount(1), token.events);
  auto transfer_from = tessera::token::transfer_from(
      token.state, spender, token.owner, make_account(3), amount(1),
      token.events);

  for (const auto& outcome : {transfer, approve, transfer_from}) {
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), transaction_error_code::operation_halted);
    EXPECT_EQ(tessera::schema::error_kind_of(outcome.value()),
              tessera::schema::error_kind_t::state);
  }
  EXPECT_TRUE(token.events.empty());
  EXPECT_EQ(tessera::token::allowance(token.state, token.owner, spender), 10);
}

TEST(ledger, move_balance_without_sides_adjusts_total_supply) {
  auto token = token_fixture{1000, 5000};
  ASSERT_FALSE(tessera::token::move_balance(token.state, std::nullopt,
                                            make_account(4), amount(50),
                                            token.events));
  EXPECT_EQ(token.state.total_supply, 1050);
  const auto& minted = token.last_event<tessera::schema::transfer_event>();
  EXPECT_TRUE(tessera::schema::is_null_account(minted.from));

  ASSERT_FALSE(tessera::token::move_balance(token.state, make_account(4),
                                            std::nullopt, amount(20),
                                            token.events));
  EXPECT_EQ(token.state.total_supply, 1030);
  const auto& burned = token.last_event<tessera::schema::transfer_event>();
  EXPECT_TRUE(tessera::schema::is_null_account(burned.to));
  token.expect_supply_invariant();
}

TEST(ledger, last_event_records_a_failure_instead_of_dereferencing) {
  auto token = token_fixture{1000, 5000};
  EXPECT_NONFATAL_FAILURE(token.last_event<tessera::schema::transfer_event>(),
                          "no events recorded");

  ASSERT_FALSE(tessera::token::approve(token.state, token.owner,
                                       make_account(2), amount(1),
                                       token.events));
  EXPECT_NONFATAL_FAILURE(token.last_event<tessera::schema::transfer_event>(),
                          "newest event has index");
}
