#pragma once
#include <consign/schema/approve_transfer.hpp>

#include <cstdint>
#include <string>
#include <tuple>

namespace consign::schema::encoding::scale {

// Wire order: version, asset.
using approve_transfer_fields_t = std::tuple<uint16_t, std::string>;

approve_transfer_fields_t to_fields(
    const consign::schema::approve_transfer<1>& o);
void from_fields(approve_transfer_fields_t&& fields,
                 consign::schema::approve_transfer<1>& o);

}  // namespace consign::schema::encoding::scale
