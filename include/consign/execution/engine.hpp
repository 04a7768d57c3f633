#pragma once

#include <consign/config/config.hpp>
#include <consign/execution/rules.hpp>
#include <consign/schema/encoding/scale/encoder.hpp>
#include <consign/schema/key/address_scheme.hpp>
#include <consign/schema/primitives.hpp>
#include <consign/schema/registration_info.hpp>
#include <consign/schema/role.hpp>
#include <consign/schema/transition_payload.hpp>
#include <consign/schema/transition_result.hpp>
#include <consign/storage/storage.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>

namespace consign::execution {

/// Deterministic state-transition function of the transfer family.
///
/// The engine holds only its family configuration and the address scheme
/// derived from it, so one instance may serve concurrent requests. Each
/// request runs against the state store the host passes in; the host is
/// responsible for serializing requests that touch the same addresses.
class engine final {
 public:
  explicit engine(consign::config::family_config family);

  const consign::config::family_config& family() const { return family_; }
  const consign::schema::key::address_scheme& addresses() const {
    return addresses_;
  }

  /// Metadata the host runtime uses to route requests to this family.
  consign::schema::registration_info_t registration() const;

  /// Decode a raw request payload.
  ///
  /// Returns std::nullopt and fills `rejection` with `invalid_action` for an
  /// unknown action tag, or `malformed_payload` for anything else that is not
  /// exactly one canonical payload.
  std::optional<consign::schema::transition_payload_t> decode_payload(
      const consign::schema::bytes_view_t& raw_payload,
      consign::schema::transition_result_t& rejection) const;

  /// Validate `payload` for `signer` and compute its write-set. Never
  /// writes. State store failures propagate as storage_error.
  template <typename Library>
  consign::schema::transition_result_t execute(
      consign::storage::state_store<Library>& store,
      std::string_view signer,
      const consign::schema::transition_payload_t& payload) const;

  template <typename Library>
  consign::schema::transition_result_t execute(
      consign::storage::state_store<Library>& store,
      std::string_view signer,
      const consign::schema::bytes_view_t& raw_payload) const;

  /// execute() followed by an atomic commit of the write-set. Throws
  /// storage_error (write_conflict) when the store does not confirm every
  /// address of the write-set.
  template <typename Library>
  consign::schema::transition_result_t apply(
      consign::storage::state_store<Library>& store,
      std::string_view signer,
      const consign::schema::transition_payload_t& payload) const;

  template <typename Library>
  consign::schema::transition_result_t apply(
      consign::storage::state_store<Library>& store,
      std::string_view signer,
      const consign::schema::bytes_view_t& raw_payload) const;

  /// Write-set that grants `role` to `identity`. Roles are provisioned
  /// outside the transition rules; this is the record layout they expect.
  consign::schema::write_set_t role_registration(
      consign::schema::role_t role,
      std::string_view identity) const;

 private:
  /// Reject payloads whose required fields are empty.
  std::optional<consign::schema::transition_result_t> validate_payload(
      const consign::schema::transition_payload_t& payload) const;

  void log_request(std::string_view signer,
                   const consign::schema::transition_payload_t& payload) const;
  void log_outcome(const consign::schema::transition_payload_t& payload,
                   const consign::schema::transition_result_t& result) const;

  template <typename Library>
  void commit(consign::storage::state_store<Library>& store,
              const consign::schema::write_set_t& write_set) const;

  consign::config::family_config family_;
  consign::schema::key::address_scheme addresses_;
};

/// BLAKE3 digest of the canonical encoding of a write-set. Equal digests on
/// two nodes mean they computed the same transition.
consign::schema::hash32_t digest(const consign::schema::write_set_t& write_set);

template <typename Library>
consign::schema::transition_result_t engine::execute(
    consign::storage::state_store<Library>& store,
    std::string_view signer,
    const consign::schema::transition_payload_t& payload) const {
  log_request(signer, payload);
  if (auto rejection = validate_payload(payload)) {
    log_outcome(payload, *rejection);
    return *rejection;
  }

  auto encoder = rules::encoder_t{};
  auto context = rules::rule_context{.addresses = addresses_,
                                     .encoder = encoder};
  auto result = std::visit(
      overloaded{[&](const consign::schema::create_asset_t& value) {
                   return rules::create_asset(context, store, signer, value);
                 },
                 [&](const consign::schema::offer_transfer_t& value) {
                   return rules::offer_transfer(context, store, signer, value);
                 },
                 [&](const consign::schema::acknowledge_transfer_t& value) {
                   return rules::acknowledge_transfer(context, store, signer,
                                                      value);
                 },
                 [&](const consign::schema::approve_transfer_t& value) {
                   return rules::approve_transfer(context, store, signer,
                                                  value);
                 },
                 [&](const consign::schema::reject_transfer_t& value) {
                   return rules::reject_transfer(context, store, signer,
                                                 value);
                 }},
      payload);
  log_outcome(payload, result);
  return result;
}

template <typename Library>
consign::schema::transition_result_t engine::execute(
    consign::storage::state_store<Library>& store,
    std::string_view signer,
    const consign::schema::bytes_view_t& raw_payload) const {
  auto rejection = consign::schema::transition_result_t{};
  auto payload = decode_payload(raw_payload, rejection);
  if (!payload) {
    spdlog::warn("Rejected payload from {}...: {} ({})",
                 signer.substr(0, 8), rejection.log, rejection.info);
    return rejection;
  }
  return execute(store, signer, *payload);
}

template <typename Library>
consign::schema::transition_result_t engine::apply(
    consign::storage::state_store<Library>& store,
    std::string_view signer,
    const consign::schema::transition_payload_t& payload) const {
  auto result = execute(store, signer, payload);
  if (consign::schema::accepted(result)) {
    commit(store, result.write_set);
  }
  return result;
}

template <typename Library>
consign::schema::transition_result_t engine::apply(
    consign::storage::state_store<Library>& store,
    std::string_view signer,
    const consign::schema::bytes_view_t& raw_payload) const {
  auto result = execute(store, signer, raw_payload);
  if (consign::schema::accepted(result)) {
    commit(store, result.write_set);
  }
  return result;
}

template <typename Library>
void engine::commit(consign::storage::state_store<Library>& store,
                    const consign::schema::write_set_t& write_set) const {
  auto confirmed = store.set(write_set);
  auto confirmed_addresses = std::set<consign::schema::address_t>(
      std::begin(confirmed), std::end(confirmed));
  auto missing = std::ranges::count_if(write_set, [&](const auto& entry) {
    return !confirmed_addresses.contains(entry.first);
  });
  if (missing > 0) {
    spdlog::error("State store left {} of {} write(s) unconfirmed", missing,
                  write_set.size());
    throw consign::storage::storage_error{
        consign::storage::storage_error_kind::write_conflict,
        "state store left " + std::to_string(missing) + " of " +
            std::to_string(write_set.size()) + " writes unconfirmed"};
  }
  spdlog::debug("Committed {} write(s)", write_set.size());
}

}  // namespace consign::execution
