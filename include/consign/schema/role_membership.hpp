#pragma once
#include <consign/schema/primitives.hpp>

#include <cstdint>

// Schema type: role membership.
// Transfer workflow: presence record for a regulator or participant. Only its
// existence at the derived address matters.
namespace consign::schema {

template <uint16_t Version>
struct role_membership;

template <>
struct role_membership<1> final {
  uint16_t version{1};
  identity_t identity;

  bool operator==(const role_membership&) const = default;
};

using role_membership_t = role_membership<1>;

}  // namespace consign::schema
