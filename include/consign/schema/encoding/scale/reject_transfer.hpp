#pragma once
#include <consign/schema/reject_transfer.hpp>

#include <cstdint>
#include <string>
#include <tuple>

namespace consign::schema::encoding::scale {

// Wire order: version, asset.
using reject_transfer_fields_t = std::tuple<uint16_t, std::string>;

reject_transfer_fields_t to_fields(
    const consign::schema::reject_transfer<1>& o);
void from_fields(reject_transfer_fields_t&& fields,
                 consign::schema::reject_transfer<1>& o);

}  // namespace consign::schema::encoding::scale
