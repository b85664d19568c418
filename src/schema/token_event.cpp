#include <tessera/schema/token_event.hpp>

#include <string>
#include <utility>

namespace tessera::schema {

namespace {

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             const bool index = true) {
  return transaction_event_attribute_t{.key = std::move(key),
                                       .value = std::move(value),
                                       .index = index};
}

// A missing owner renders as the null account, like mint and burn transfers.
std::string account_string(const std::optional<account_id_t>& account) {
  return to_hex(account.value_or(make_null_account()));
}

}  // namespace

transaction_event_t make_transaction_event(const token_event_t& event) {
  auto out = transaction_event_t{};
  std::visit(
      overloaded{
          [&](const transfer_event& value) {
            out.type = "transfer";
            out.attributes.push_back(make_attribute("from", to_hex(value.from)));
            out.attributes.push_back(make_attribute("to", to_hex(value.to)));
            out.attributes.push_back(
                make_attribute("amount", to_string(value.amount), false));
          },
          [&](const approval_event& value) {
            out.type = "approval";
            out.attributes.push_back(
                make_attribute("owner", to_hex(value.owner)));
            out.attributes.push_back(
                make_attribute("spender", to_hex(value.spender)));
            out.attributes.push_back(
                make_attribute("amount", to_string(value.amount), false));
          },
          [&](const paused_event& value) {
            out.type = "paused";
            out.attributes.push_back(
                make_attribute("account", to_hex(value.account)));
          },
          [&](const unpaused_event& value) {
            out.type = "unpaused";
            out.attributes.push_back(
                make_attribute("account", to_hex(value.account)));
          },
          [&](const asset_info_updated_event& value) {
            out.type = "asset_info_updated";
            out.attributes.push_back(make_attribute("uri", value.uri, false));
            out.attributes.push_back(
                make_attribute("updated_by", to_hex(value.updated_by)));
          },
          [&](const ownership_transferred_event& value) {
            out.type = "ownership_transferred";
            out.attributes.push_back(make_attribute(
                "previous_owner", account_string(value.previous_owner)));
            out.attributes.push_back(
                make_attribute("new_owner", account_string(value.new_owner)));
          }},
      event);
  return out;
}

}  // namespace tessera::schema
