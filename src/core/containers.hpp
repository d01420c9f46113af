#pragma once

#include <cstddef>

#include <ankerl/unordered_dense.h>

namespace bastion::core {

// Dense hash containers (ankerl::unordered_dense) for the hot lookup tables:
// revocation fingerprints and rate-limit counters are probed on every request.
//
// Iterator invalidation follows std::vector: erase() moves the last element into
// the erased slot and returns an iterator to that same position.

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

/// Remove every entry matching pred(key, value); returns the number removed
template <typename Map, typename Pred>
size_t erase_where(Map& map, Pred pred) {
    size_t removed = 0;
    for (auto it = map.begin(); it != map.end();) {
        if (pred(it->first, it->second)) {
            it = map.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}  // namespace bastion::core
