#pragma once

#include <consign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role.
// Transfer workflow: presence-only memberships provisioned outside the
// transition rules. Only regulators gate a rule today.
namespace consign::schema {

enum class role_t : uint8_t {
  regulator = 0,
  participant = 1,
};

inline constexpr auto kRoleMappings = std::array{
    std::pair<std::string_view, role_t>{"regulator", role_t::regulator},
    std::pair<std::string_view, role_t>{"participant", role_t::participant},
};

template <>
inline std::optional<role_t> try_from_string<role_t>(
    const std::string_view value) {
  return from_string(value, kRoleMappings);
}

inline constexpr std::string_view to_string(const role_t value) {
  return to_string(value, kRoleMappings).value_or("unknown");
}

}  // namespace consign::schema
