#pragma once
#include <consign/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: asset state.
// Transfer workflow: current ownership record. Created once per name, owner
// replaced when a regulator approves a transfer, never deleted.
namespace consign::schema {

template <uint16_t Version>
struct asset_state;

// Wire order lives in schema/encoding/scale/asset_state.hpp.
template <>
struct asset_state<1> final {
  uint16_t version{1};
  std::string name;
  identity_t owner;

  bool operator==(const asset_state&) const = default;
};

using asset_state_t = asset_state<1>;

}  // namespace consign::schema
