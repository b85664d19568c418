#pragma once
#include <tessera/schema/primitives.hpp>

namespace tessera::schema {

template <uint16_t Version>
struct pause;

template <>
struct pause<1> final {
  uint16_t version{1};
};

using pause_t = pause<1>;

}  // namespace tessera::schema
