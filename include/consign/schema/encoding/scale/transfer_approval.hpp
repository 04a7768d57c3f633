#pragma once
#include <consign/schema/transfer_approval.hpp>

#include <cstdint>
#include <string>
#include <tuple>

namespace consign::schema::encoding::scale {

// Wire order: version, name, owner.
using transfer_approval_fields_t = std::tuple<uint16_t, std::string, identity_t>;

transfer_approval_fields_t to_fields(
    const consign::schema::transfer_approval<1>& o);
void from_fields(transfer_approval_fields_t&& fields,
                 consign::schema::transfer_approval<1>& o);

}  // namespace consign::schema::encoding::scale
