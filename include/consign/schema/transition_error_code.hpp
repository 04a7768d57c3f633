#pragma once

#include <consign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace consign::schema {

enum class transition_error_code : uint32_t {
  asset_already_exists = 1,
  asset_not_found = 2,
  not_owner = 3,
  no_pending_transfer = 4,
  not_designated_buyer = 5,
  no_pending_approval = 6,
  not_regulator = 7,
  invalid_action = 8,
  malformed_payload = 9,
  decode_failure = 10,
};

inline constexpr auto kTransitionErrorCodeMappings = std::array{
    std::pair<std::string_view, transition_error_code>{
        "asset_already_exists", transition_error_code::asset_already_exists},
    std::pair<std::string_view, transition_error_code>{
        "asset_not_found", transition_error_code::asset_not_found},
    std::pair<std::string_view, transition_error_code>{
        "not_owner", transition_error_code::not_owner},
    std::pair<std::string_view, transition_error_code>{
        "no_pending_transfer", transition_error_code::no_pending_transfer},
    std::pair<std::string_view, transition_error_code>{
        "not_designated_buyer", transition_error_code::not_designated_buyer},
    std::pair<std::string_view, transition_error_code>{
        "no_pending_approval", transition_error_code::no_pending_approval},
    std::pair<std::string_view, transition_error_code>{
        "not_regulator", transition_error_code::not_regulator},
    std::pair<std::string_view, transition_error_code>{
        "invalid_action", transition_error_code::invalid_action},
    std::pair<std::string_view, transition_error_code>{
        "malformed_payload", transition_error_code::malformed_payload},
    std::pair<std::string_view, transition_error_code>{
        "decode_failure", transition_error_code::decode_failure},
};

template <>
inline std::optional<transition_error_code>
try_from_string<transition_error_code>(const std::string_view value) {
  return from_string(value, kTransitionErrorCodeMappings);
}

inline constexpr std::string_view to_string(const transition_error_code value) {
  return to_string(value, kTransitionErrorCodeMappings).value_or("unknown");
}

}  // namespace consign::schema
