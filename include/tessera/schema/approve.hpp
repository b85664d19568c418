#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: approve.
// Token workflow: sets (overwrites) the spender's allowance over the signer's
// balance.
namespace tessera::schema {

template <uint16_t Version>
struct approve;

template <>
struct approve<1> final {
  uint16_t version{1};
  account_id_t spender{};
  amount_t amount{0};
};

using approve_t = approve<1>;

}  // namespace tessera::schema
