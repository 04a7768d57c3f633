#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace consign::schema {

/// Name table for an enum. Names are the stable, log-facing spelling.
template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::ranges::find(mappings, value,
                              &std::pair<std::string_view, Enum>::first);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::ranges::find(mappings, value,
                              &std::pair<std::string_view, Enum>::second);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->first;
}

// Every enum that can be parsed provides a specialization next to its
// mapping table; anything else fails to compile.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) = delete;

}  // namespace consign::schema
