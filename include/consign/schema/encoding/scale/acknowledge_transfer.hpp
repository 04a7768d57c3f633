#pragma once
#include <consign/schema/acknowledge_transfer.hpp>

#include <cstdint>
#include <string>
#include <tuple>

namespace consign::schema::encoding::scale {

// Wire order: version, asset.
using acknowledge_transfer_fields_t = std::tuple<uint16_t, std::string>;

acknowledge_transfer_fields_t to_fields(
    const consign::schema::acknowledge_transfer<1>& o);
void from_fields(acknowledge_transfer_fields_t&& fields,
                 consign::schema::acknowledge_transfer<1>& o);

}  // namespace consign::schema::encoding::scale
