#include <consign/schema/primitives.hpp>

#include <string_view>

namespace consign::schema {

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    out.push_back(kHex[(byte >> 4u) & 0x0Fu]);
    out.push_back(kHex[byte & 0x0Fu]);
  }
  return out;
}

}  // namespace consign::schema
