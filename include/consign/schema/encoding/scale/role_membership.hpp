#pragma once
#include <consign/schema/role_membership.hpp>

#include <cstdint>
#include <string>
#include <tuple>

namespace consign::schema::encoding::scale {

// Wire order: version, identity.
using role_membership_fields_t = std::tuple<uint16_t, identity_t>;

role_membership_fields_t to_fields(
    const consign::schema::role_membership<1>& o);
void from_fields(role_membership_fields_t&& fields,
                 consign::schema::role_membership<1>& o);

}  // namespace consign::schema::encoding::scale
