#include <consign/common/critical.hpp>
#include <consign/schema/encoding/scale/transition_payload.hpp>

#include <iterator>
#include <scale/scale.hpp>
#include <utility>

using namespace consign::schema;

namespace consign::schema::encoding::scale {

namespace {

template <typename Payload>
std::optional<transition_payload_t> decode_alternative(
    const bytes_view_t& bytes) {
  using fields_t = decltype(to_fields(std::declval<const Payload&>()));
  auto decoded = ::scale::impl::memory::decode<fields_t>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  auto payload = Payload{};
  from_fields(std::move(decoded.value()), payload);
  return transition_payload_t{std::move(payload)};
}

}  // namespace

void encode(const transition_payload_t& payload, bytes_t& out) {
  out.push_back(static_cast<uint8_t>(payload.index()));
  auto encoded = std::visit(
      [](const auto& value) {
        return ::scale::impl::memory::encode(to_fields(value));
      },
      payload);
  if (!encoded) {
    consign::common::critical("failed to encode SCALE payload");
  }
  out.insert(std::end(out), std::begin(encoded.value()),
             std::end(encoded.value()));
}

std::optional<transition_payload_t> try_decode(const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return std::nullopt;
  }
  auto body = bytes.subspan(1);
  switch (bytes[0]) {
    case static_cast<uint8_t>(action_t::create):
      return decode_alternative<create_asset_t>(body);
    case static_cast<uint8_t>(action_t::transfer):
      return decode_alternative<offer_transfer_t>(body);
    case static_cast<uint8_t>(action_t::acknowledge):
      return decode_alternative<acknowledge_transfer_t>(body);
    case static_cast<uint8_t>(action_t::accept):
      return decode_alternative<approve_transfer_t>(body);
    case static_cast<uint8_t>(action_t::reject):
      return decode_alternative<reject_transfer_t>(body);
    default:
      return std::nullopt;
  }
}

}  // namespace consign::schema::encoding::scale
