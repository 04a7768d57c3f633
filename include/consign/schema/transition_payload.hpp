#pragma once
#include <consign/schema/acknowledge_transfer.hpp>
#include <consign/schema/action.hpp>
#include <consign/schema/approve_transfer.hpp>
#include <consign/schema/create_asset.hpp>
#include <consign/schema/offer_transfer.hpp>
#include <consign/schema/reject_transfer.hpp>

#include <string_view>
#include <variant>

namespace consign::schema {

// Alternative order must follow action_t.
using transition_payload_t = std::variant<create_asset_t,
                                          offer_transfer_t,
                                          acknowledge_transfer_t,
                                          approve_transfer_t,
                                          reject_transfer_t>;

static_assert(std::variant_size_v<transition_payload_t> ==
              kActionMappings.size());

inline action_t action_of(const transition_payload_t& payload) {
  return static_cast<action_t>(payload.index());
}

/// Asset the payload targets, whichever action it carries.
inline std::string_view asset_of(const transition_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const create_asset_t& value) -> std::string_view {
            return value.name;
          },
          [](const offer_transfer_t& value) -> std::string_view {
            return value.asset;
          },
          [](const acknowledge_transfer_t& value) -> std::string_view {
            return value.asset;
          },
          [](const approve_transfer_t& value) -> std::string_view {
            return value.asset;
          },
          [](const reject_transfer_t& value) -> std::string_view {
            return value.asset;
          }},
      payload);
}

}  // namespace consign::schema
