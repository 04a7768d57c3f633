#include <consign/schema/encoding/scale/reject_transfer.hpp>

#include <utility>

using namespace consign::schema;

namespace consign::schema::encoding::scale {

reject_transfer_fields_t to_fields(const reject_transfer<1>& o) {
  return {o.version, o.asset};
}

void from_fields(reject_transfer_fields_t&& fields, reject_transfer<1>& o) {
  std::tie(o.version, o.asset) = std::move(fields);
}

}  // namespace consign::schema::encoding::scale
