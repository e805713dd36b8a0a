#pragma once

#include <ankerl/unordered_dense.h>

namespace prism::core {

// Dense hash containers (ankerl::unordered_dense). Iteration order is
// insertion order until an erase; iterators invalidate like std::vector.
//
// Usage:
//   prism::core::fast_map<std::string, std::shared_ptr<Session>> sessions;
//   prism::core::fast_set<uint64_t> excluded_endpoints;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace prism::core
