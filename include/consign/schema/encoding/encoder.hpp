#pragma once
#include <consign/schema/primitives.hpp>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

namespace consign::schema::encoding {

/// Raised by encoder::decode when bytes do not form a valid value of the
/// requested type. Empty input always raises.
class decode_error final : public std::runtime_error {
 public:
  explicit decode_error(const std::string& message)
      : std::runtime_error{message} {}
};

// Library selection is a build time setting: callers name the tag of the
// wire format they need and get the matching specialization.
template <typename Library>
struct encoder {
  template <typename T>
  consign::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, consign::schema::bytes_t& out);

  template <typename T>
  T decode(const consign::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const consign::schema::bytes_view_t& bytes);
};

}  // namespace consign::schema::encoding
