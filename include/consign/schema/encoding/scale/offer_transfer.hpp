#pragma once
#include <consign/schema/offer_transfer.hpp>

#include <cstdint>
#include <string>
#include <tuple>

namespace consign::schema::encoding::scale {

// Wire order: version, asset, new_owner.
using offer_transfer_fields_t = std::tuple<uint16_t, std::string, identity_t>;

offer_transfer_fields_t to_fields(const consign::schema::offer_transfer<1>& o);
void from_fields(offer_transfer_fields_t&& fields,
                 consign::schema::offer_transfer<1>& o);

}  // namespace consign::schema::encoding::scale
