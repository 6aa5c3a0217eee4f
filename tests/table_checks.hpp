#pragma once
#include <cstddef>
#include <cstdint>
#include <set>
#include <utility>

#include "hash_policy.hpp"

// Hash that maps every key to a multiple of 16, three keys per value, so a
// 16-bucket table puts everything in bucket 0 and equal hashes are common.
struct CollidingHash
{
  std::size_t operator()(int k) const { return static_cast<std::size_t>(k / 3) * 16; }
};

// Walks the table in cursor order and checks that every entry sits in the
// bucket its hash selects and that hashes never decrease inside a bucket.
template <class Table, class Hash>
bool chains_sorted(const Table& t, Hash hasher)
{
  bool first = true;
  std::size_t last_idx = 0;
  std::uint32_t last_hash = 0;
  auto cur = t.keys();
  while (cur.has_next()) {
    const auto& k = cur.next();
    std::uint32_t h = spread_hash(hasher(k));
    std::size_t idx = bucket_index(h, t.bucket_count());
    if (!first) {
      if (idx < last_idx) return false;
      if (idx == last_idx && h < last_hash) return false;
    }
    first = false;
    last_idx = idx;
    last_hash = h;
  }
  return true;
}

// Number of entries the cursor yields, and whether any key repeats.
template <class Table>
std::pair<std::size_t, bool> walk_keys(const Table& t)
{
  std::set<typename Table::key_type> seen;
  std::size_t n = 0;
  bool dup = false;
  for (const auto& k : t.keys()) {
    if (!seen.insert(k).second) dup = true;
    ++n;
  }
  return {n, dup};
}
