#pragma once

#include <consign/schema/key/entity_kind.hpp>
#include <consign/schema/primitives.hpp>
#include <consign/schema/role.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace consign::schema::key {

inline constexpr std::size_t kNamespacePrefixLength = 6;
inline constexpr std::size_t kEntityKindLength = 2;
inline constexpr std::size_t kAddressLength = 70;
inline constexpr std::size_t kEntityHashLength =
    kAddressLength - kNamespacePrefixLength - kEntityKindLength;

/// Maps (entity kind, entity key) to a fixed-length namespaced address.
///
/// address = sha512(namespace)[0..6] || kind tag (2 hex) ||
///           sha512(key)[0..62]
///
/// The namespace is injected so each family (and each test) can derive its
/// own address space; nothing here depends on process-wide state.
class address_scheme final {
 public:
  explicit address_scheme(std::string_view namespace_name);

  const std::string& namespace_name() const { return namespace_name_; }

  /// The 6 hex chars every address of this namespace starts with.
  const std::string& prefix() const { return prefix_; }

  /// Prefix plus kind tag; every address of one entity kind starts with it.
  std::string kind_prefix(entity_kind kind) const;

  address_t address(entity_kind kind, std::string_view key) const;

  /// True when `address` is well formed and belongs to this namespace.
  bool owns(std::string_view address) const;

 private:
  std::string namespace_name_;
  std::string prefix_;
};

/// 2 lowercase hex chars for the kind.
std::string kind_code(entity_kind kind);

/// True for a 70 char lowercase hex string.
bool is_valid_address(std::string_view address);

address_t make_asset_address(const address_scheme& scheme,
                             std::string_view name);
address_t make_offer_address(const address_scheme& scheme,
                             std::string_view asset);
address_t make_ackn_address(const address_scheme& scheme,
                            std::string_view asset);
address_t make_approve_address(const address_scheme& scheme,
                               std::string_view asset);
address_t make_regulator_address(const address_scheme& scheme,
                                 std::string_view identity);
address_t make_participant_address(const address_scheme& scheme,
                                   std::string_view identity);
address_t make_role_address(const address_scheme& scheme,
                            consign::schema::role_t role,
                            std::string_view identity);

}  // namespace consign::schema::key
