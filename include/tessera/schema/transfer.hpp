#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: transfer.
// Token workflow: moves amount from the signer's balance to a recipient.
namespace tessera::schema {

template <uint16_t Version>
struct transfer;

template <>
struct transfer<1> final {
  uint16_t version{1};
  account_id_t to{};
  amount_t amount{0};
};

using transfer_t = transfer<1>;

}  // namespace tessera::schema
