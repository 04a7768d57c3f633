#pragma once
#include <consign/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: transfer approval.
// Transfer workflow: an acknowledged transfer waiting on a regulator. `owner`
// is the prospective new owner, i.e. the identity that acknowledged.
namespace consign::schema {

template <uint16_t Version>
struct transfer_approval;

template <>
struct transfer_approval<1> final {
  uint16_t version{1};
  std::string name;
  identity_t owner;

  bool operator==(const transfer_approval&) const = default;
};

using transfer_approval_t = transfer_approval<1>;

}  // namespace consign::schema
