#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: renounce ownership.
// Token workflow: clears the owner for good. Every owner-only operation fails
// afterwards.
namespace tessera::schema {

template <uint16_t Version>
struct renounce_ownership;

template <>
struct renounce_ownership<1> final {
  uint16_t version{1};
};

using renounce_ownership_t = renounce_ownership<1>;

}  // namespace tessera::schema
