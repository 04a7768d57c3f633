#pragma once
#include <consign/common/critical.hpp>
#include <consign/schema/encoding/encoder.hpp>
#include <consign/schema/encoding/scale/acknowledge_transfer.hpp>
#include <consign/schema/encoding/scale/approve_transfer.hpp>
#include <consign/schema/encoding/scale/asset_state.hpp>
#include <consign/schema/encoding/scale/create_asset.hpp>
#include <consign/schema/encoding/scale/offer_transfer.hpp>
#include <consign/schema/encoding/scale/reject_transfer.hpp>
#include <consign/schema/encoding/scale/role_membership.hpp>
#include <consign/schema/encoding/scale/transfer_approval.hpp>
#include <consign/schema/encoding/scale/transfer_offer.hpp>
#include <consign/schema/encoding/scale/transition_payload.hpp>
#include <iterator>
#include <scale/scale.hpp>
#include <type_traits>
#include <utility>

namespace consign::schema::encoding {

struct scale_encoder_tag {};

namespace scale {

// Schema records spell out their wire order through a to_fields/from_fields
// pair; everything else (strings, tuples, containers) goes to the codec as
// is.
template <typename T>
concept has_fields = requires(const T& o) { to_fields(o); };

template <typename T>
using fields_t = decltype(to_fields(std::declval<const T&>()));

}  // namespace scale

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  consign::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, consign::schema::bytes_t& out);

  template <typename T>
  T decode(const consign::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const consign::schema::bytes_view_t& bytes);
};

template <typename T>
consign::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto out = consign::schema::bytes_t{};
  encode(obj, out);
  return out;
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        consign::schema::bytes_t& out) {
  if constexpr (std::is_same_v<T, consign::schema::transition_payload_t>) {
    scale::encode(obj, out);
  } else {
    auto encoded = [&] {
      if constexpr (scale::has_fields<T>) {
        return ::scale::impl::memory::encode(scale::to_fields(obj));
      } else {
        return ::scale::impl::memory::encode(obj);
      }
    }();
    if (!encoded) {
      consign::common::critical("failed to encode SCALE object");
    }
    out.insert(std::end(out), std::begin(encoded.value()),
               std::end(encoded.value()));
  }
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const consign::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    throw decode_error{"cannot decode SCALE value from empty bytes"};
  }
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    throw decode_error{"failed to decode SCALE bytes"};
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const consign::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return std::nullopt;
  }
  if constexpr (std::is_same_v<T, consign::schema::transition_payload_t>) {
    return scale::try_decode(bytes);
  } else if constexpr (scale::has_fields<T>) {
    auto decoded = ::scale::impl::memory::decode<scale::fields_t<T>>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    auto out = T{};
    scale::from_fields(std::move(decoded.value()), out);
    return out;
  } else {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }
}

}  // namespace consign::schema::encoding
