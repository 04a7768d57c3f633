#pragma once
#include <consign/schema/create_asset.hpp>

#include <cstdint>
#include <string>
#include <tuple>

namespace consign::schema::encoding::scale {

// Wire order: version, name.
using create_asset_fields_t = std::tuple<uint16_t, std::string>;

create_asset_fields_t to_fields(const consign::schema::create_asset<1>& o);
void from_fields(create_asset_fields_t&& fields,
                 consign::schema::create_asset<1>& o);

}  // namespace consign::schema::encoding::scale
