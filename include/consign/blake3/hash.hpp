#pragma once
#include <consign/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace consign::blake3 {

consign::schema::hash32_t hash(const std::string_view& str);
consign::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace consign::blake3
