#include <consign/schema/encoding/scale/role_membership.hpp>

#include <utility>

using namespace consign::schema;

namespace consign::schema::encoding::scale {

role_membership_fields_t to_fields(const role_membership<1>& o) {
  return {o.version, o.identity};
}

void from_fields(role_membership_fields_t&& fields, role_membership<1>& o) {
  std::tie(o.version, o.identity) = std::move(fields);
}

}  // namespace consign::schema::encoding::scale
