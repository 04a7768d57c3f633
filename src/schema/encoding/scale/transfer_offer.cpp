#include <consign/schema/encoding/scale/transfer_offer.hpp>

#include <utility>

using namespace consign::schema;

namespace consign::schema::encoding::scale {

transfer_offer_fields_t to_fields(const transfer_offer<1>& o) {
  return {o.version, o.asset, o.owner};
}

void from_fields(transfer_offer_fields_t&& fields, transfer_offer<1>& o) {
  std::tie(o.version, o.asset, o.owner) = std::move(fields);
}

}  // namespace consign::schema::encoding::scale
