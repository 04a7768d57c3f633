#pragma once

#include <consign/schema/acknowledge_transfer.hpp>
#include <consign/schema/approve_transfer.hpp>
#include <consign/schema/asset_state.hpp>
#include <consign/schema/create_asset.hpp>
#include <consign/schema/encoding/scale/encoder.hpp>
#include <consign/schema/key/address_scheme.hpp>
#include <consign/schema/offer_transfer.hpp>
#include <consign/schema/reject_transfer.hpp>
#include <consign/schema/transfer_approval.hpp>
#include <consign/schema/transfer_offer.hpp>
#include <consign/schema/transition_error_code.hpp>
#include <consign/schema/transition_result.hpp>
#include <consign/storage/storage.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Transition rules. Each rule reads the smallest address set it needs through
// the store, validates, and returns either a rejection or the complete
// write-set. Rules never write; committing is the caller's decision.
//
// Slot topology per asset:
//   asset[name]     asset_state_t        CreateAsset, ApproveTransfer
//   ackn[asset]     transfer_offer_t     OfferTransfer -> AcknowledgeTransfer
//   approve[asset]  transfer_approval_t  AcknowledgeTransfer ->
//                                        ApproveTransfer | RejectTransfer
// The transfer_offer entity kind is reserved and never written.
namespace consign::execution::rules {

using encoder_t = consign::schema::encoding::encoder<
    consign::schema::encoding::scale_encoder_tag>;

inline constexpr std::string_view kCodespace{"consign.apply"};

struct rule_context final {
  const consign::schema::key::address_scheme& addresses;
  encoder_t& encoder;
};

consign::schema::transition_result_t make_rejection(
    consign::schema::transition_error_code code,
    std::string log,
    std::string info = {});

consign::schema::transition_result_t make_acceptance(
    consign::schema::write_set_t write_set);

/// Decode a stored record. A record of another schema version is treated as
/// undecodable.
template <typename T>
std::optional<T> decode_record(rule_context& context,
                               const consign::schema::bytes_t& bytes) {
  auto record = context.encoder.template try_decode<T>(
      consign::schema::bytes_view_t{bytes.data(), bytes.size()});
  if (record && record->version != T{}.version) {
    return std::nullopt;
  }
  return record;
}

/// Register `payload.name` with the signer as its owner.
template <typename Store>
consign::schema::transition_result_t create_asset(
    rule_context& context,
    Store& store,
    std::string_view signer,
    const consign::schema::create_asset_t& payload) {
  auto address =
      consign::schema::key::make_asset_address(context.addresses, payload.name);
  auto entries = store.get({address});
  if (consign::storage::find_present(entries, address)) {
    return make_rejection(
        consign::schema::transition_error_code::asset_already_exists,
        "Asset name in use", payload.name);
  }

  auto write_set = consign::schema::write_set_t{};
  write_set.emplace(address, context.encoder.encode(consign::schema::asset_state_t{
                                 .name = payload.name,
                                 .owner = std::string{signer}}));
  return make_acceptance(std::move(write_set));
}

/// Record `payload.new_owner` as the identity that must acknowledge next.
template <typename Store>
consign::schema::transition_result_t offer_transfer(
    rule_context& context,
    Store& store,
    std::string_view signer,
    const consign::schema::offer_transfer_t& payload) {
  auto asset_address = consign::schema::key::make_asset_address(
      context.addresses, payload.asset);
  auto entries = store.get({asset_address});
  auto entry = consign::storage::find_present(entries, asset_address);
  if (!entry) {
    return make_rejection(
        consign::schema::transition_error_code::asset_not_found,
        "Asset does not exist", payload.asset);
  }
  auto asset = decode_record<consign::schema::asset_state_t>(context, *entry);
  if (!asset) {
    return make_rejection(
        consign::schema::transition_error_code::decode_failure,
        "Asset record could not be decoded", asset_address);
  }
  if (asset->owner != signer) {
    return make_rejection(consign::schema::transition_error_code::not_owner,
                          "Only an Asset's owner may transfer it",
                          payload.asset);
  }

  auto write_set = consign::schema::write_set_t{};
  write_set.emplace(
      consign::schema::key::make_ackn_address(context.addresses, payload.asset),
      context.encoder.encode(consign::schema::transfer_offer_t{
          .asset = payload.asset, .owner = payload.new_owner}));
  return make_acceptance(std::move(write_set));
}

/// Designated buyer accepts the offer; the transfer moves to the approval
/// slot with the signer as prospective owner.
template <typename Store>
consign::schema::transition_result_t acknowledge_transfer(
    rule_context& context,
    Store& store,
    std::string_view signer,
    const consign::schema::acknowledge_transfer_t& payload) {
  auto ackn_address =
      consign::schema::key::make_ackn_address(context.addresses, payload.asset);
  auto entries = store.get({ackn_address});
  auto entry = consign::storage::find_present(entries, ackn_address);
  if (!entry) {
    return make_rejection(
        consign::schema::transition_error_code::no_pending_transfer,
        "Asset is not being transferred", payload.asset);
  }
  auto offer = decode_record<consign::schema::transfer_offer_t>(context, *entry);
  if (!offer) {
    return make_rejection(
        consign::schema::transition_error_code::decode_failure,
        "Transfer offer could not be decoded", ackn_address);
  }
  if (offer->owner != signer) {
    return make_rejection(
        consign::schema::transition_error_code::not_designated_buyer,
        "Transfers can only be acknowledged by the new buyer", payload.asset);
  }

  auto write_set = consign::schema::write_set_t{};
  write_set.emplace(ackn_address, consign::schema::bytes_t{});
  write_set.emplace(
      consign::schema::key::make_approve_address(context.addresses,
                                                 payload.asset),
      context.encoder.encode(consign::schema::transfer_approval_t{
          .name = payload.asset, .owner = std::string{signer}}));
  return make_acceptance(std::move(write_set));
}

/// Regulator completes the transfer. Ownership moves to the buyer recorded in
/// the approval slot, not to the regulator.
template <typename Store>
consign::schema::transition_result_t approve_transfer(
    rule_context& context,
    Store& store,
    std::string_view signer,
    const consign::schema::approve_transfer_t& payload) {
  auto approve_address = consign::schema::key::make_approve_address(
      context.addresses, payload.asset);
  auto regulator_address =
      consign::schema::key::make_regulator_address(context.addresses, signer);
  auto entries = store.get({approve_address, regulator_address});

  auto entry = consign::storage::find_present(entries, approve_address);
  if (!entry) {
    return make_rejection(
        consign::schema::transition_error_code::no_pending_approval,
        "Asset has no transfer awaiting approval", payload.asset);
  }
  if (!consign::storage::find_present(entries, regulator_address)) {
    return make_rejection(
        consign::schema::transition_error_code::not_regulator,
        "You are not a regulator", std::string{signer});
  }
  auto approval =
      decode_record<consign::schema::transfer_approval_t>(context, *entry);
  if (!approval) {
    return make_rejection(
        consign::schema::transition_error_code::decode_failure,
        "Transfer approval could not be decoded", approve_address);
  }

  auto write_set = consign::schema::write_set_t{};
  write_set.emplace(
      consign::schema::key::make_asset_address(context.addresses,
                                               payload.asset),
      context.encoder.encode(consign::schema::asset_state_t{
          .name = payload.asset, .owner = approval->owner}));
  write_set.emplace(approve_address, consign::schema::bytes_t{});
  return make_acceptance(std::move(write_set));
}

/// Prospective owner withdraws; the asset keeps its current owner.
template <typename Store>
consign::schema::transition_result_t reject_transfer(
    rule_context& context,
    Store& store,
    std::string_view signer,
    const consign::schema::reject_transfer_t& payload) {
  auto approve_address = consign::schema::key::make_approve_address(
      context.addresses, payload.asset);
  auto entries = store.get({approve_address});
  auto entry = consign::storage::find_present(entries, approve_address);
  if (!entry) {
    return make_rejection(
        consign::schema::transition_error_code::no_pending_approval,
        "Asset has no transfer awaiting approval", payload.asset);
  }
  auto approval =
      decode_record<consign::schema::transfer_approval_t>(context, *entry);
  if (!approval) {
    return make_rejection(
        consign::schema::transition_error_code::decode_failure,
        "Transfer approval could not be decoded", approve_address);
  }
  if (approval->owner != signer) {
    return make_rejection(
        consign::schema::transition_error_code::not_designated_buyer,
        "Transfers can only be rejected by the potential new owner",
        payload.asset);
  }

  auto write_set = consign::schema::write_set_t{};
  write_set.emplace(approve_address, consign::schema::bytes_t{});
  return make_acceptance(std::move(write_set));
}

}  // namespace consign::execution::rules
