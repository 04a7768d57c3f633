#pragma once
#include <consign/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema payload: create asset.
// Transfer workflow: Registers a new asset owned by the signer.
namespace consign::schema {

template <uint16_t Version>
struct create_asset;

template <>
struct create_asset<1> final {
  uint16_t version{1};
  std::string name;

  bool operator==(const create_asset&) const = default;
};

using create_asset_t = create_asset<1>;

}  // namespace consign::schema
