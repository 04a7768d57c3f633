#pragma once

#include <consign/schema/primitives.hpp>
#include <consign/schema/transition_error_code.hpp>
#include <consign/schema/write_set.hpp>

#include <cstdint>
#include <string>

namespace consign::schema {

template <uint16_t Version>
struct transition_result;

// `code` is zero when the request was accepted, otherwise a
// transition_error_code. `write_set` is only populated when accepted.
template <>
struct transition_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  write_set_t write_set;
};

using transition_result_t = transition_result<1>;

inline bool accepted(const transition_result_t& result) {
  return result.code == 0;
}

inline bool rejected_with(const transition_result_t& result,
                          const transition_error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

}  // namespace consign::schema
