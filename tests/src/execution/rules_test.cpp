#include <consign/schema/asset_state.hpp>
#include <consign/schema/transfer_approval.hpp>
#include <consign/schema/transfer_offer.hpp>
#include <consign/testing/common.hpp>
#include <consign/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <utility>

namespace {

using consign::schema::transition_error_code;
using consign::testing::kAlice;
using consign::testing::kBob;
using consign::testing::kCarol;
using consign::testing::kRegulator;

consign::schema::create_asset_t create(std::string name) {
  return consign::schema::create_asset_t{.name = std::move(name)};
}

consign::schema::offer_transfer_t offer(std::string asset,
                                        std::string_view new_owner) {
  return consign::schema::offer_transfer_t{
      .asset = std::move(asset), .new_owner = std::string{new_owner}};
}

consign::schema::acknowledge_transfer_t acknowledge(std::string asset) {
  return consign::schema::acknowledge_transfer_t{.asset = std::move(asset)};
}

consign::schema::approve_transfer_t approve(std::string asset) {
  return consign::schema::approve_transfer_t{.asset = std::move(asset)};
}

consign::schema::reject_transfer_t reject(std::string asset) {
  return consign::schema::reject_transfer_t{.asset = std::move(asset)};
}

}  // namespace

TEST(rules, create_asset_records_signer_as_owner) {
  auto fixture = consign::testing::execution_fixture{};
  auto result = fixture.apply(kAlice, create("widget"));
  ASSERT_TRUE(consign::schema::accepted(result));
  ASSERT_EQ(result.write_set.size(), 1u);
  EXPECT_TRUE(result.write_set.contains(fixture.asset_address("widget")));

  auto asset = consign::testing::read_record<consign::schema::asset_state_t>(
      fixture.store().snapshot(), fixture.asset_address("widget"));
  ASSERT_TRUE(asset.has_value());
  EXPECT_EQ(asset->name, "widget");
  EXPECT_EQ(asset->owner, kAlice);
}

TEST(rules, create_asset_rejects_duplicate_name) {
  auto fixture = consign::testing::execution_fixture{};
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kAlice, create("widget"))));
  auto before = fixture.store().snapshot();

  auto result = fixture.apply(kBob, create("widget"));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::asset_already_exists));
  EXPECT_EQ(result.log, "Asset name in use");
  EXPECT_EQ(result.codespace, consign::execution::rules::kCodespace);
  EXPECT_TRUE(result.write_set.empty());
  EXPECT_EQ(fixture.store().snapshot(), before);
}

TEST(rules, offer_transfer_requires_existing_asset) {
  auto fixture = consign::testing::execution_fixture{};
  auto result = fixture.apply(kAlice, offer("widget", kBob));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::asset_not_found));
  EXPECT_TRUE(fixture.store().snapshot().empty());
}

TEST(rules, offer_transfer_requires_owner) {
  auto fixture = consign::testing::execution_fixture{};
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kAlice, create("widget"))));
  auto before = fixture.store().snapshot();

  auto result = fixture.apply(kBob, offer("widget", kBob));
  EXPECT_TRUE(
      consign::schema::rejected_with(result, transition_error_code::not_owner));
  EXPECT_EQ(result.log, "Only an Asset's owner may transfer it");
  EXPECT_EQ(fixture.store().snapshot(), before);
}

TEST(rules, offer_transfer_designates_buyer) {
  auto fixture = consign::testing::execution_fixture{};
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kAlice, create("widget"))));

  auto result = fixture.apply(kAlice, offer("widget", kBob));
  ASSERT_TRUE(consign::schema::accepted(result));
  ASSERT_EQ(result.write_set.size(), 1u);

  auto pending =
      consign::testing::read_record<consign::schema::transfer_offer_t>(
          fixture.store().snapshot(), fixture.ackn_address("widget"));
  ASSERT_TRUE(pending.has_value());
  EXPECT_EQ(pending->asset, "widget");
  EXPECT_EQ(pending->owner, kBob);

  // Ownership does not change until a regulator approves.
  auto asset = consign::testing::read_record<consign::schema::asset_state_t>(
      fixture.store().snapshot(), fixture.asset_address("widget"));
  ASSERT_TRUE(asset.has_value());
  EXPECT_EQ(asset->owner, kAlice);
}

TEST(rules, offer_transfer_replaces_previous_offer) {
  auto fixture = consign::testing::execution_fixture{};
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kAlice, create("widget"))));
  ASSERT_TRUE(
      consign::schema::accepted(fixture.apply(kAlice, offer("widget", kBob))));
  ASSERT_TRUE(consign::schema::accepted(
      fixture.apply(kAlice, offer("widget", kCarol))));

  EXPECT_TRUE(consign::schema::rejected_with(
      fixture.apply(kBob, acknowledge("widget")),
      transition_error_code::not_designated_buyer));
  EXPECT_TRUE(
      consign::schema::accepted(fixture.apply(kCarol, acknowledge("widget"))));
}

TEST(rules, acknowledge_requires_pending_offer) {
  auto fixture = consign::testing::execution_fixture{};
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kAlice, create("widget"))));
  auto before = fixture.store().snapshot();

  auto result = fixture.apply(kBob, acknowledge("widget"));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::no_pending_transfer));
  EXPECT_EQ(result.log, "Asset is not being transferred");
  EXPECT_TRUE(result.write_set.empty());
  EXPECT_EQ(fixture.store().snapshot(), before);
}

TEST(rules, acknowledge_by_other_identity_leaves_offer_in_place) {
  auto fixture = consign::testing::execution_fixture{};
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kAlice, create("widget"))));
  ASSERT_TRUE(
      consign::schema::accepted(fixture.apply(kAlice, offer("widget", kBob))));
  auto before = fixture.store().snapshot();

  auto result = fixture.apply(kCarol, acknowledge("widget"));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::not_designated_buyer));
  EXPECT_EQ(fixture.store().snapshot(), before);
}

TEST(rules, acknowledge_moves_offer_to_approval) {
  auto fixture = consign::testing::execution_fixture{};
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kAlice, create("widget"))));
  ASSERT_TRUE(
      consign::schema::accepted(fixture.apply(kAlice, offer("widget", kBob))));

  auto result = fixture.apply(kBob, acknowledge("widget"));
  ASSERT_TRUE(consign::schema::accepted(result));
  ASSERT_EQ(result.write_set.size(), 2u);
  EXPECT_TRUE(result.write_set.at(fixture.ackn_address("widget")).empty());

  auto snapshot = fixture.store().snapshot();
  EXPECT_FALSE(snapshot.contains(fixture.ackn_address("widget")));
  auto approval =
      consign::testing::read_record<consign::schema::transfer_approval_t>(
          snapshot, fixture.approve_address("widget"));
  ASSERT_TRUE(approval.has_value());
  EXPECT_EQ(approval->name, "widget");
  EXPECT_EQ(approval->owner, kBob);
}

TEST(rules, approve_requires_pending_approval) {
  auto fixture = consign::testing::execution_fixture{};
  fixture.register_regulator(kRegulator);
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kAlice, create("widget"))));
  auto before = fixture.store().snapshot();

  auto result = fixture.apply(kRegulator, approve("widget"));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::no_pending_approval));
  EXPECT_TRUE(result.write_set.empty());
  EXPECT_EQ(fixture.store().snapshot(), before);
}

TEST(rules, approve_requires_regulator) {
  auto fixture = consign::testing::execution_fixture{};
  fixture.register_regulator(kRegulator);
  fixture.make_pending_approval("widget", kAlice, kBob);
  auto before = fixture.store().snapshot();

  auto result = fixture.apply(kBob, approve("widget"));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::not_regulator));
  EXPECT_EQ(result.log, "You are not a regulator");
  EXPECT_EQ(fixture.store().snapshot(), before);
}

TEST(rules, participant_role_does_not_grant_approval) {
  auto fixture = consign::testing::execution_fixture{};
  fixture.make_pending_approval("widget", kAlice, kBob);
  fixture.store().set(fixture.engine().role_registration(
      consign::schema::role_t::participant, kCarol));

  EXPECT_TRUE(consign::schema::rejected_with(
      fixture.apply(kCarol, approve("widget")),
      transition_error_code::not_regulator));
}

TEST(rules, approve_transfers_ownership_to_buyer) {
  auto fixture = consign::testing::execution_fixture{};
  fixture.register_regulator(kRegulator);
  fixture.make_pending_approval("widget", kAlice, kBob);

  auto result = fixture.apply(kRegulator, approve("widget"));
  ASSERT_TRUE(consign::schema::accepted(result));
  ASSERT_EQ(result.write_set.size(), 2u);

  auto snapshot = fixture.store().snapshot();
  EXPECT_FALSE(snapshot.contains(fixture.approve_address("widget")));
  auto asset = consign::testing::read_record<consign::schema::asset_state_t>(
      snapshot, fixture.asset_address("widget"));
  ASSERT_TRUE(asset.has_value());
  EXPECT_EQ(asset->owner, kBob);

  // The approval is consumed.
  EXPECT_TRUE(consign::schema::rejected_with(
      fixture.apply(kRegulator, approve("widget")),
      transition_error_code::no_pending_approval));
}

TEST(rules, reject_requires_pending_approval) {
  auto fixture = consign::testing::execution_fixture{};
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kAlice, create("widget"))));
  auto before = fixture.store().snapshot();

  auto result = fixture.apply(kBob, reject("widget"));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::no_pending_approval));
  EXPECT_TRUE(result.write_set.empty());
  EXPECT_EQ(fixture.store().snapshot(), before);
}

TEST(rules, reject_before_acknowledgment_leaves_offer_in_place) {
  auto fixture = consign::testing::execution_fixture{};
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kAlice, create("widget"))));
  ASSERT_TRUE(
      consign::schema::accepted(fixture.apply(kAlice, offer("widget", kBob))));
  auto before = fixture.store().snapshot();

  auto result = fixture.apply(kBob, reject("widget"));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::no_pending_approval));
  EXPECT_TRUE(result.write_set.empty());
  EXPECT_EQ(fixture.store().snapshot(), before);

  auto pending =
      consign::testing::read_record<consign::schema::transfer_offer_t>(
          fixture.store().snapshot(), fixture.ackn_address("widget"));
  ASSERT_TRUE(pending.has_value());
  EXPECT_EQ(pending->owner, kBob);
}

TEST(rules, reject_requires_prospective_owner) {
  auto fixture = consign::testing::execution_fixture{};
  fixture.make_pending_approval("widget", kAlice, kBob);
  auto before = fixture.store().snapshot();

  auto result = fixture.apply(kAlice, reject("widget"));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::not_designated_buyer));
  EXPECT_EQ(result.log,
            "Transfers can only be rejected by the potential new owner");
  EXPECT_EQ(fixture.store().snapshot(), before);
}

TEST(rules, reject_returns_asset_to_created_state) {
  auto fixture = consign::testing::execution_fixture{};
  fixture.register_regulator(kRegulator);
  fixture.make_pending_approval("widget", kAlice, kBob);

  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kBob, reject("widget"))));
  auto snapshot = fixture.store().snapshot();
  EXPECT_FALSE(snapshot.contains(fixture.approve_address("widget")));
  EXPECT_FALSE(snapshot.contains(fixture.ackn_address("widget")));
  auto asset = consign::testing::read_record<consign::schema::asset_state_t>(
      snapshot, fixture.asset_address("widget"));
  ASSERT_TRUE(asset.has_value());
  EXPECT_EQ(asset->owner, kAlice);

  EXPECT_TRUE(consign::schema::rejected_with(
      fixture.apply(kRegulator, approve("widget")),
      transition_error_code::no_pending_approval));
  // The owner may offer again.
  EXPECT_TRUE(
      consign::schema::accepted(fixture.apply(kAlice, offer("widget", kCarol))));
}

TEST(rules, corrupt_asset_record_is_a_decode_failure) {
  auto fixture = consign::testing::execution_fixture{};
  fixture.store().set({{fixture.asset_address("widget"), {0xFF}}});

  auto result = fixture.apply(kAlice, offer("widget", kBob));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::decode_failure));
  EXPECT_EQ(result.info, fixture.asset_address("widget"));
}

TEST(rules, stored_record_of_another_version_is_a_decode_failure) {
  auto fixture = consign::testing::execution_fixture{};
  auto encoder = consign::testing::scale_encoder_t{};
  fixture.store().set(
      {{fixture.asset_address("widget"),
        encoder.encode(consign::schema::asset_state_t{
            .version = 2, .name = "widget", .owner = std::string{kAlice}})}});
  auto before = fixture.store().snapshot();

  auto result = fixture.apply(kAlice, offer("widget", kBob));
  EXPECT_TRUE(consign::schema::rejected_with(
      result, transition_error_code::decode_failure));
  EXPECT_EQ(result.info, fixture.asset_address("widget"));
  EXPECT_EQ(fixture.store().snapshot(), before);
}

TEST(rules, assets_are_independent) {
  auto fixture = consign::testing::execution_fixture{};
  fixture.register_regulator(kRegulator);
  fixture.make_pending_approval("widget", kAlice, kBob);
  ASSERT_TRUE(consign::schema::accepted(fixture.apply(kCarol, create("gadget"))));

  EXPECT_TRUE(consign::schema::rejected_with(
      fixture.apply(kBob, acknowledge("gadget")),
      transition_error_code::no_pending_transfer));
  EXPECT_TRUE(
      consign::schema::accepted(fixture.apply(kRegulator, approve("widget"))));

  auto gadget = consign::testing::read_record<consign::schema::asset_state_t>(
      fixture.store().snapshot(), fixture.asset_address("gadget"));
  ASSERT_TRUE(gadget.has_value());
  EXPECT_EQ(gadget->owner, kCarol);
}
