#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace consign::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using hash64_t = std::array<uint8_t, 64>;

// Hex encoded ledger state key.
using address_t = std::string;
// Authenticated signer identity, normally a hex public key.
using identity_t = std::string;

/// Lowercase hex, two characters per byte, no prefix.
std::string to_hex(const bytes_view_t& bytes);

}  // namespace consign::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
