#pragma once

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <string>

namespace lattice::core {

// Hash containers backed by ankerl::unordered_dense.
//
// Iteration follows insertion order (dense vector storage), so a map filled
// in a deterministic order also iterates deterministically. Anything that
// reaches a snapshot or a status batch is still emitted through sorted
// containers; these aliases are for lookup indexes.
//
// Iterator invalidation: like std::vector (invalidates on insertion).

template <typename Key, typename Value, typename Hash = ankerl::unordered_dense::hash<Key>>
using fast_map = ankerl::unordered_dense::map<Key, Value, Hash>;

template <typename Key, typename Hash = ankerl::unordered_dense::hash<Key>>
using fast_set = ankerl::unordered_dense::set<Key, Hash>;

/// Combine two 64-bit hashes (boost::hash_combine mixing constant)
[[nodiscard]] inline uint64_t hash_combine(uint64_t seed, uint64_t value) noexcept {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

/// Hash a string with the same function the containers use
[[nodiscard]] inline uint64_t hash_string(const std::string& s) noexcept {
    return ankerl::unordered_dense::hash<std::string>{}(s);
}

}  // namespace lattice::core
