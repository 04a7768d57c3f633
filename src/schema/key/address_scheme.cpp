#include <consign/common/critical.hpp>
#include <consign/crypto/digest.hpp>
#include <consign/schema/key/address_scheme.hpp>

#include <algorithm>

namespace consign::schema::key {

address_scheme::address_scheme(std::string_view namespace_name)
    : namespace_name_{namespace_name},
      prefix_{consign::crypto::sha512_hex(namespace_name,
                                          kNamespacePrefixLength)} {}

std::string address_scheme::kind_prefix(entity_kind kind) const {
  return prefix_ + kind_code(kind);
}

address_t address_scheme::address(entity_kind kind,
                                  std::string_view key) const {
  auto out = kind_prefix(kind);
  out.reserve(kAddressLength);
  out += consign::crypto::sha512_hex(key, kEntityHashLength);
  return out;
}

bool address_scheme::owns(std::string_view address) const {
  return is_valid_address(address) && address.starts_with(prefix_);
}

std::string kind_code(entity_kind kind) {
  auto value = static_cast<uint8_t>(kind);
  return consign::schema::to_hex(consign::schema::bytes_view_t{&value, 1});
}

bool is_valid_address(std::string_view address) {
  return address.size() == kAddressLength &&
         std::ranges::all_of(address, [](const char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

address_t make_asset_address(const address_scheme& scheme,
                             std::string_view name) {
  return scheme.address(entity_kind::asset, name);
}

address_t make_offer_address(const address_scheme& scheme,
                             std::string_view asset) {
  return scheme.address(entity_kind::transfer_offer, asset);
}

address_t make_ackn_address(const address_scheme& scheme,
                            std::string_view asset) {
  return scheme.address(entity_kind::transfer_ackn, asset);
}

address_t make_approve_address(const address_scheme& scheme,
                               std::string_view asset) {
  return scheme.address(entity_kind::transfer_approve, asset);
}

address_t make_regulator_address(const address_scheme& scheme,
                                 std::string_view identity) {
  return scheme.address(entity_kind::regulator, identity);
}

address_t make_participant_address(const address_scheme& scheme,
                                   std::string_view identity) {
  return scheme.address(entity_kind::participant, identity);
}

address_t make_role_address(const address_scheme& scheme,
                            consign::schema::role_t role,
                            std::string_view identity) {
  switch (role) {
    case consign::schema::role_t::regulator:
      return make_regulator_address(scheme, identity);
    case consign::schema::role_t::participant:
      return make_participant_address(scheme, identity);
  }
  consign::common::critical("unknown role");
}

}  // namespace consign::schema::key
