#pragma once
#include <consign/schema/primitives.hpp>

#include <map>

namespace consign::schema {

/// Every address -> value write one transition produces. An empty value
/// clears the address. Ordered so that iteration and encoding are identical
/// on every node.
using write_set_t = std::map<address_t, bytes_t>;

}  // namespace consign::schema
