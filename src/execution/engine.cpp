#include <consign/blake3/hash.hpp>
#include <consign/execution/engine.hpp>
#include <consign/schema/role_membership.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

using namespace consign::schema;

namespace consign::execution {

engine::engine(consign::config::family_config family)
    : family_{std::move(family)}, addresses_{family_.name} {
  spdlog::info("Initializing transition engine for family '{}' v{} ({})",
               family_.name, family_.version, addresses_.prefix());
}

registration_info_t engine::registration() const {
  auto info = registration_info_t{};
  info.family_name = family_.name;
  info.family_version = family_.version;
  info.content_type = family_.content_type;
  info.namespaces = {addresses_.prefix()};
  return info;
}

std::optional<transition_payload_t> engine::decode_payload(
    const bytes_view_t& raw_payload,
    transition_result_t& rejection) const {
  if (raw_payload.empty()) {
    rejection = rules::make_rejection(transition_error_code::malformed_payload,
                                      "empty payload");
    return std::nullopt;
  }
  // The first byte is the variant index, i.e. the action tag.
  if (raw_payload[0] >= std::variant_size_v<transition_payload_t>) {
    rejection = rules::make_rejection(
        transition_error_code::invalid_action,
        "Action must be \"create\", \"transfer\", \"acknowledge\", "
        "\"accept\", or \"reject\"",
        "action tag " + std::to_string(raw_payload[0]));
    return std::nullopt;
  }

  auto encoder = rules::encoder_t{};
  auto payload = encoder.try_decode<transition_payload_t>(raw_payload);
  if (!payload) {
    rejection = rules::make_rejection(transition_error_code::malformed_payload,
                                      "payload could not be decoded",
                                      std::string{to_string(static_cast<action_t>(
                                          raw_payload[0]))});
    return std::nullopt;
  }
  // Only the canonical encoding is accepted, which also rules out trailing
  // bytes after the payload.
  auto canonical = encoder.encode(*payload);
  if (!std::ranges::equal(canonical, raw_payload)) {
    rejection = rules::make_rejection(transition_error_code::malformed_payload,
                                      "payload is not canonically encoded",
                                      std::string{to_string(action_of(*payload))});
    return std::nullopt;
  }
  return payload;
}

std::optional<transition_result_t> engine::validate_payload(
    const transition_payload_t& payload) const {
  auto version = std::visit(
      [](const auto& value) -> std::pair<uint16_t, uint16_t> {
        using payload_t = std::remove_cvref_t<decltype(value)>;
        return {value.version, payload_t{}.version};
      },
      payload);
  if (version.first != version.second) {
    return rules::make_rejection(
        transition_error_code::malformed_payload,
        "unsupported payload version",
        "expected version " + std::to_string(version.second));
  }

  auto missing = std::optional<std::string_view>{};
  std::visit(overloaded{[&](const create_asset_t& value) {
                          if (value.name.empty()) {
                            missing = "name";
                          }
                        },
                        [&](const offer_transfer_t& value) {
                          if (value.asset.empty()) {
                            missing = "asset";
                          } else if (value.new_owner.empty()) {
                            missing = "new_owner";
                          }
                        },
                        [&](const acknowledge_transfer_t& value) {
                          if (value.asset.empty()) {
                            missing = "asset";
                          }
                        },
                        [&](const approve_transfer_t& value) {
                          if (value.asset.empty()) {
                            missing = "asset";
                          }
                        },
                        [&](const reject_transfer_t& value) {
                          if (value.asset.empty()) {
                            missing = "asset";
                          }
                        }},
             payload);
  if (!missing) {
    return std::nullopt;
  }
  return rules::make_rejection(
      transition_error_code::malformed_payload,
      std::string{to_string(action_of(payload))} + " requires a non-empty " +
          std::string{*missing});
}

write_set_t engine::role_registration(role_t role,
                                      std::string_view identity) const {
  auto encoder = rules::encoder_t{};
  auto write_set = write_set_t{};
  write_set.emplace(
      key::make_role_address(addresses_, role, identity),
      encoder.encode(role_membership_t{.identity = std::string{identity}}));
  return write_set;
}

void engine::log_request(std::string_view signer,
                         const transition_payload_t& payload) const {
  if (const auto* offer = std::get_if<offer_transfer_t>(&payload)) {
    spdlog::info("Handling transaction: {} > {} > {}... :: {}...",
                 to_string(action_of(payload)), asset_of(payload),
                 std::string_view{offer->new_owner}.substr(0, 8),
                 signer.substr(0, 8));
    return;
  }
  spdlog::info("Handling transaction: {} > {} :: {}...",
               to_string(action_of(payload)), asset_of(payload),
               signer.substr(0, 8));
}

void engine::log_outcome(const transition_payload_t& payload,
                         const transition_result_t& result) const {
  if (accepted(result)) {
    spdlog::debug("{} > {} accepted with {} write(s)",
                  to_string(action_of(payload)), asset_of(payload),
                  result.write_set.size());
    return;
  }
  spdlog::warn("{} > {} rejected [{}]: {}", to_string(action_of(payload)),
               asset_of(payload),
               to_string(static_cast<transition_error_code>(result.code)),
               result.log);
}

hash32_t digest(const write_set_t& write_set) {
  auto entries = std::vector<std::tuple<std::string, bytes_t>>{};
  entries.reserve(write_set.size());
  std::ranges::transform(write_set, std::back_inserter(entries),
                         [](const auto& entry) {
                           return std::tuple{entry.first, entry.second};
                         });
  auto encoder = rules::encoder_t{};
  auto encoded = encoder.encode(entries);
  return consign::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace consign::execution
