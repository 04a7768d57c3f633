#pragma once

#include <consign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: action.
// Transfer workflow: the five request kinds. Values match the alternative
// index of transition_payload_t and are part of the wire format.
namespace consign::schema {

enum class action_t : uint8_t {
  create = 0,
  transfer = 1,
  acknowledge = 2,
  accept = 3,
  reject = 4,
};

inline constexpr auto kActionMappings = std::array{
    std::pair<std::string_view, action_t>{"create", action_t::create},
    std::pair<std::string_view, action_t>{"transfer", action_t::transfer},
    std::pair<std::string_view, action_t>{"acknowledge", action_t::acknowledge},
    std::pair<std::string_view, action_t>{"accept", action_t::accept},
    std::pair<std::string_view, action_t>{"reject", action_t::reject},
};

template <>
inline std::optional<action_t> try_from_string<action_t>(
    const std::string_view value) {
  return from_string(value, kActionMappings);
}

inline constexpr std::string_view to_string(const action_t value) {
  return to_string(value, kActionMappings).value_or("unknown");
}

}  // namespace consign::schema
