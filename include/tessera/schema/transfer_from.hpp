#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: transfer from.
// Token workflow: spends an allowance granted by from to the signer.
namespace tessera::schema {

template <uint16_t Version>
struct transfer_from;

template <>
struct transfer_from<1> final {
  uint16_t version{1};
  account_id_t from{};
  account_id_t to{};
  amount_t amount{0};
};

using transfer_from_t = transfer_from<1>;

}  // namespace tessera::schema
