#pragma once
#include <tessera/schema/primitives.hpp>

namespace tessera::schema {

template <uint16_t Version>
struct burn;

template <>
struct burn<1> final {
  uint16_t version{1};
  amount_t amount{0};
};

using burn_t = burn<1>;

}  // namespace tessera::schema
