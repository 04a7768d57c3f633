#pragma once
#include <consign/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema payload: reject transfer.
// Transfer workflow: Prospective owner withdraws from a pending transfer.
namespace consign::schema {

template <uint16_t Version>
struct reject_transfer;

template <>
struct reject_transfer<1> final {
  uint16_t version{1};
  std::string asset;

  bool operator==(const reject_transfer&) const = default;
};

using reject_transfer_t = reject_transfer<1>;

}  // namespace consign::schema
