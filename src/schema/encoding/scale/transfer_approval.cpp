#include <consign/schema/encoding/scale/transfer_approval.hpp>

#include <utility>

using namespace consign::schema;

namespace consign::schema::encoding::scale {

transfer_approval_fields_t to_fields(const transfer_approval<1>& o) {
  return {o.version, o.name, o.owner};
}

void from_fields(transfer_approval_fields_t&& fields, transfer_approval<1>& o) {
  std::tie(o.version, o.name, o.owner) = std::move(fields);
}

}  // namespace consign::schema::encoding::scale
