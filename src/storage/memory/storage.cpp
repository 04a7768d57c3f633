#include <consign/storage/memory/storage.hpp>
#include <spdlog/spdlog.h>

namespace consign::storage {

state_entries_t state_store<memory_state_store_tag>::get(
    const std::vector<consign::schema::address_t>& addresses) const {
  auto lock = std::scoped_lock{*mutex};
  auto found = state_entries_t{};
  for (const auto& address : addresses) {
    auto it = entries.find(address);
    if (it != std::end(entries)) {
      found.emplace(it->first, it->second);
    }
  }
  return found;
}

std::vector<consign::schema::address_t> state_store<memory_state_store_tag>::set(
    const state_entries_t& values) {
  auto lock = std::scoped_lock{*mutex};
  auto confirmed = std::vector<consign::schema::address_t>{};
  confirmed.reserve(values.size());
  for (const auto& [address, value] : values) {
    if (value.empty()) {
      entries.erase(address);
    } else {
      entries.insert_or_assign(address, value);
    }
    confirmed.push_back(address);
  }
  spdlog::trace("Memory state store applied {} write(s)", confirmed.size());
  return confirmed;
}

state_entries_t state_store<memory_state_store_tag>::snapshot() const {
  auto lock = std::scoped_lock{*mutex};
  return entries;
}

template <>
state_store<memory_state_store_tag> make_state_store<memory_state_store_tag>() {
  return state_store<memory_state_store_tag>{};
}

}  // namespace consign::storage
