#pragma once
#include <consign/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema payload: approve transfer.
// Transfer workflow: Regulator decision that completes a pending transfer.
namespace consign::schema {

template <uint16_t Version>
struct approve_transfer;

template <>
struct approve_transfer<1> final {
  uint16_t version{1};
  std::string asset;

  bool operator==(const approve_transfer&) const = default;
};

using approve_transfer_t = approve_transfer<1>;

}  // namespace consign::schema
