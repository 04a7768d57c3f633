#include <consign/schema/encoding/scale/acknowledge_transfer.hpp>

#include <utility>

using namespace consign::schema;

namespace consign::schema::encoding::scale {

acknowledge_transfer_fields_t to_fields(const acknowledge_transfer<1>& o) {
  return {o.version, o.asset};
}

void from_fields(acknowledge_transfer_fields_t&& fields, acknowledge_transfer<1>& o) {
  std::tie(o.version, o.asset) = std::move(fields);
}

}  // namespace consign::schema::encoding::scale
