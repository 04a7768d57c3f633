#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace consign::schema {

template <uint16_t Version>
struct registration_info;

// Metadata the host runtime routes requests with.
template <>
struct registration_info<1> final {
  uint16_t schema_version{1};
  std::string family_name;
  std::string family_version;
  std::string content_type;
  std::vector<std::string> namespaces;
};

using registration_info_t = registration_info<1>;

}  // namespace consign::schema
