#include <consign/schema/encoding/scale/create_asset.hpp>

#include <utility>

using namespace consign::schema;

namespace consign::schema::encoding::scale {

create_asset_fields_t to_fields(const create_asset<1>& o) {
  return {o.version, o.name};
}

void from_fields(create_asset_fields_t&& fields, create_asset<1>& o) {
  std::tie(o.version, o.name) = std::move(fields);
}

}  // namespace consign::schema::encoding::scale
