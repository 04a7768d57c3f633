#pragma once

#include <consign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: entity kind.
// Transfer workflow: the 2-hex-char tag that separates record families inside
// the application namespace. The hex form of the enum value is the tag.
namespace consign::schema::key {

enum class entity_kind : uint8_t {
  asset = 0x00,
  transfer_offer = 0x10,
  transfer_ackn = 0x11,
  transfer_approve = 0x12,
  regulator = 0x20,
  participant = 0x21,
};

inline constexpr auto kEntityKinds = std::array{
    entity_kind::asset,           entity_kind::transfer_offer,
    entity_kind::transfer_ackn,   entity_kind::transfer_approve,
    entity_kind::regulator,       entity_kind::participant,
};

inline constexpr auto kEntityKindMappings = std::array{
    std::pair<std::string_view, entity_kind>{"asset", entity_kind::asset},
    std::pair<std::string_view, entity_kind>{"transfer_offer",
                                             entity_kind::transfer_offer},
    std::pair<std::string_view, entity_kind>{"transfer_ackn",
                                             entity_kind::transfer_ackn},
    std::pair<std::string_view, entity_kind>{"transfer_approve",
                                             entity_kind::transfer_approve},
    std::pair<std::string_view, entity_kind>{"regulator",
                                             entity_kind::regulator},
    std::pair<std::string_view, entity_kind>{"participant",
                                             entity_kind::participant},
};

inline constexpr std::string_view to_string(const entity_kind value) {
  return consign::schema::to_string(value, kEntityKindMappings)
      .value_or("unknown");
}

}  // namespace consign::schema::key

namespace consign::schema {

template <>
inline std::optional<key::entity_kind> try_from_string<key::entity_kind>(
    const std::string_view value) {
  return from_string(value, key::kEntityKindMappings);
}

}  // namespace consign::schema
