#pragma once
#include <consign/schema/primitives.hpp>
#include <consign/schema/write_set.hpp>

#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace consign::storage {

/// Values read back from the store, keyed by address. Addresses that hold no
/// value are either missing or map to empty bytes.
using state_entries_t = consign::schema::write_set_t;

enum class storage_error_kind : uint8_t {
  io = 0,
  write_conflict = 1,
};

/// Fatal processing failure of the state store. Never attributable to the
/// submitter, so it is thrown rather than reported as a rejection.
class storage_error final : public std::runtime_error {
 public:
  storage_error(const storage_error_kind kind, const std::string& message)
      : std::runtime_error{message}, kind_{kind} {}

  storage_error_kind kind() const { return kind_; }

 private:
  storage_error_kind kind_;
};

/// Key-value view of ledger state that transition rules read through and
/// write-sets are committed to.
template <typename Library>
struct state_store {
  /// Return the current values of `addresses`.
  state_entries_t get(const std::vector<consign::schema::address_t>& addresses)
      const;

  /// Apply all entries as one unit and return the addresses the backend
  /// confirmed. An empty value clears its address.
  std::vector<consign::schema::address_t> set(const state_entries_t& entries);
};

/// Construct a concrete state store backend.
template <typename Library>
state_store<Library> make_state_store();

/// Value at `address`, or std::nullopt when absent or cleared.
inline std::optional<consign::schema::bytes_t> find_present(
    const state_entries_t& entries,
    const consign::schema::address_t& address) {
  auto it = entries.find(address);
  if (it == std::end(entries) || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace consign::storage
