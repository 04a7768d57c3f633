#pragma once

#include <consign/schema/encoding/scale/encoder.hpp>
#include <consign/schema/primitives.hpp>
#include <consign/schema/transition_payload.hpp>
#include <consign/storage/storage.hpp>

#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace consign::testing {

using scale_encoder_t = consign::schema::encoding::encoder<
    consign::schema::encoding::scale_encoder_tag>;

inline constexpr std::string_view kAlice{
    "02a1633cafcc01ebfb6d78e39f687a1f0995c62fc95f51ead10a02ee0be551b5dc"};
inline constexpr std::string_view kBob{
    "03b0bd634234abbb1ba1e986e884185c61cf43e001f9137f23c2c409273eb16e65"};
inline constexpr std::string_view kCarol{
    "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"};
inline constexpr std::string_view kRegulator{"regulator1"};

inline consign::schema::bytes_t encode_payload(
    const consign::schema::transition_payload_t& payload) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(payload);
}

inline consign::schema::bytes_view_t view(const consign::schema::bytes_t& bytes) {
  return consign::schema::bytes_view_t{bytes.data(), bytes.size()};
}

/// Decode the live record at `address`, or std::nullopt when absent.
template <typename T>
std::optional<T> read_record(const consign::storage::state_entries_t& entries,
                             const consign::schema::address_t& address) {
  auto value = consign::storage::find_present(entries, address);
  if (!value) {
    return std::nullopt;
  }
  auto encoder = scale_encoder_t{};
  return encoder.try_decode<T>(view(*value));
}

inline std::string make_random_name(std::mt19937_64& rng,
                                    const std::size_t length) {
  static constexpr auto kAlphabet = std::string_view{
      "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_"};
  auto pick = std::uniform_int_distribution<std::size_t>{0,
                                                        kAlphabet.size() - 1};
  auto name = std::string{};
  name.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    name.push_back(kAlphabet[pick(rng)]);
  }
  return name;
}

}  // namespace consign::testing
