#pragma once
#include <tessera/schema/primitives.hpp>

namespace tessera::schema {

template <uint16_t Version>
struct unpause;

template <>
struct unpause<1> final {
  uint16_t version{1};
};

using unpause_t = unpause<1>;

}  // namespace tessera::schema
