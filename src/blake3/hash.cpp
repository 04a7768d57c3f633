#include <blake3.h>
#include <consign/blake3/hash.hpp>
#include <tuple>

namespace consign::blake3 {

namespace {

consign::schema::hash32_t finalize(const void* data, std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<consign::schema::hash32_t>);
  auto output = consign::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

consign::schema::hash32_t hash(const std::string_view& str) {
  return finalize(str.data(), str.size());
}

consign::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return finalize(bytes.data(), bytes.size());
}

}  // namespace consign::blake3
