#include <consign/schema/encoding/scale/asset_state.hpp>

#include <utility>

using namespace consign::schema;

namespace consign::schema::encoding::scale {

asset_state_fields_t to_fields(const asset_state<1>& o) {
  return {o.version, o.name, o.owner};
}

void from_fields(asset_state_fields_t&& fields, asset_state<1>& o) {
  std::tie(o.version, o.name, o.owner) = std::move(fields);
}

}  // namespace consign::schema::encoding::scale
