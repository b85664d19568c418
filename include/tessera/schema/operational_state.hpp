#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: operational state.
// Token workflow: emergency-stop switch; halted blocks every balance and
// allowance mutation until the owner resumes the token.
namespace tessera::schema {

enum class operational_state_t : uint8_t {
  active = 0,
  halted = 1,
};

inline constexpr auto kOperationalStateMappings = std::array{
    std::pair<std::string_view, operational_state_t>{
        "active", operational_state_t::active},
    std::pair<std::string_view, operational_state_t>{
        "halted", operational_state_t::halted},
};

template <>
inline std::optional<operational_state_t> try_from_string<operational_state_t>(
    const std::string_view value) {
  return from_string(value, kOperationalStateMappings);
}

inline constexpr std::string_view to_string(const operational_state_t value) {
  return to_string(value, kOperationalStateMappings).value_or("unknown");
}

}  // namespace tessera::schema
