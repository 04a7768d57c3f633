#pragma once
#include <consign/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema payload: offer transfer.
// Transfer workflow: current owner names the identity that must acknowledge
// next.
namespace consign::schema {

template <uint16_t Version>
struct offer_transfer;

template <>
struct offer_transfer<1> final {
  uint16_t version{1};
  std::string asset;
  identity_t new_owner;

  bool operator==(const offer_transfer&) const = default;
};

using offer_transfer_t = offer_transfer<1>;

}  // namespace consign::schema
