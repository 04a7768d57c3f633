#include <consign/schema/encoding/scale/offer_transfer.hpp>

#include <utility>

using namespace consign::schema;

namespace consign::schema::encoding::scale {

offer_transfer_fields_t to_fields(const offer_transfer<1>& o) {
  return {o.version, o.asset, o.new_owner};
}

void from_fields(offer_transfer_fields_t&& fields, offer_transfer<1>& o) {
  std::tie(o.version, o.asset, o.new_owner) = std::move(fields);
}

}  // namespace consign::schema::encoding::scale
