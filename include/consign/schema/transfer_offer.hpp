#pragma once
#include <consign/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: transfer offer.
// Transfer workflow: lives in the acknowledgment slot of an asset and names
// the identity that must acknowledge next.
namespace consign::schema {

template <uint16_t Version>
struct transfer_offer;

template <>
struct transfer_offer<1> final {
  uint16_t version{1};
  std::string asset;
  identity_t owner;

  bool operator==(const transfer_offer&) const = default;
};

using transfer_offer_t = transfer_offer<1>;

}  // namespace consign::schema
