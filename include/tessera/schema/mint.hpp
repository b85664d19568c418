#pragma once
#include <tessera/schema/primitives.hpp>

namespace tessera::schema {

template <uint16_t Version>
struct mint;

template <>
struct mint<1> final {
  uint16_t version{1};
  account_id_t to{};
  amount_t amount{0};
};

using mint_t = mint<1>;

}  // namespace tessera::schema
