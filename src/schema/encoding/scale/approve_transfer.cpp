#include <consign/schema/encoding/scale/approve_transfer.hpp>

#include <utility>

using namespace consign::schema;

namespace consign::schema::encoding::scale {

approve_transfer_fields_t to_fields(const approve_transfer<1>& o) {
  return {o.version, o.asset};
}

void from_fields(approve_transfer_fields_t&& fields, approve_transfer<1>& o) {
  std::tie(o.version, o.asset) = std::move(fields);
}

}  // namespace consign::schema::encoding::scale
