#pragma once
#include <consign/storage/storage.hpp>

#include <memory>
#include <mutex>

namespace consign::storage {

struct memory_state_store_tag {};

/// In-process backend. Each get/set holds the mutex for its whole duration,
/// so a set is observed either completely or not at all. Cleared addresses
/// are erased.
template <>
struct state_store<memory_state_store_tag> final {
  std::unique_ptr<std::mutex> mutex{std::make_unique<std::mutex>()};
  state_entries_t entries;

  state_entries_t get(
      const std::vector<consign::schema::address_t>& addresses) const;
  std::vector<consign::schema::address_t> set(const state_entries_t& values);

  /// Copy of every live entry.
  state_entries_t snapshot() const;
};

template <>
state_store<memory_state_store_tag> make_state_store<memory_state_store_tag>();

}  // namespace consign::storage
