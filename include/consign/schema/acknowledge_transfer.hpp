#pragma once
#include <consign/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema payload: acknowledge transfer.
// Transfer workflow: Accepts an offer as its designated buyer.
namespace consign::schema {

template <uint16_t Version>
struct acknowledge_transfer;

template <>
struct acknowledge_transfer<1> final {
  uint16_t version{1};
  std::string asset;

  bool operator==(const acknowledge_transfer&) const = default;
};

using acknowledge_transfer_t = acknowledge_transfer<1>;

}  // namespace consign::schema
