#pragma once
#include <consign/schema/asset_state.hpp>

#include <cstdint>
#include <string>
#include <tuple>

namespace consign::schema::encoding::scale {

// Wire order: version, name, owner.
using asset_state_fields_t = std::tuple<uint16_t, std::string, identity_t>;

asset_state_fields_t to_fields(const consign::schema::asset_state<1>& o);
void from_fields(asset_state_fields_t&& fields,
                 consign::schema::asset_state<1>& o);

}  // namespace consign::schema::encoding::scale
