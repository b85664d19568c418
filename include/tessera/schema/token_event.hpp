#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction_event.hpp>

#include <optional>
#include <string>
#include <variant>

// Schema type: token event.
// Token workflow: typed notifications emitted by successful ledger and
// governance operations. A null account in a transfer marks mint (from) or
// burn (to).
namespace tessera::schema {

struct transfer_event final {
  account_id_t from{};
  account_id_t to{};
  amount_t amount{0};
};

struct approval_event final {
  account_id_t owner{};
  account_id_t spender{};
  amount_t amount{0};
};

struct paused_event final {
  account_id_t account{};
};

struct unpaused_event final {
  account_id_t account{};
};

struct asset_info_updated_event final {
  std::string uri;
  account_id_t updated_by{};
};

struct ownership_transferred_event final {
  std::optional<account_id_t> previous_owner;
  std::optional<account_id_t> new_owner;
};

using token_event_t = std::variant<transfer_event,
                                   approval_event,
                                   paused_event,
                                   unpaused_event,
                                   asset_info_updated_event,
                                   ownership_transferred_event>;

/// Render a typed token event as a host event: accounts are lower-case hex,
/// amounts are decimal, an absent owner is rendered as the null account.
transaction_event_t make_transaction_event(const token_event_t& event);

}  // namespace tessera::schema
