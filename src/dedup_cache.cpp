// -----------------------------------------------------------------------------
// dedup_cache.cpp — packet id cache
// API: see include/viamesh/dedup_cache.hpp
// -----------------------------------------------------------------------------
#include "viamesh/dedup_cache.hpp"
#include "etl/vector.h"

namespace viamesh {

bool DedupCache::seen(uint32_t id) const {
  return first_seen_.find(id) != first_seen_.end();
}

void DedupCache::record(uint32_t id, uint64_t now_ms) {
  if (seen(id)) return;                 // first sighting wins
  if (first_seen_.full()) evict_oldest();
  first_seen_.insert(std::make_pair(id, now_ms));
}

// evict() — two passes: collect, then erase (no erase while iterating).
size_t DedupCache::evict(uint64_t now_ms, uint64_t horizon_ms) {
  etl::vector<uint32_t, CAPACITY> expired;
  for (const auto& entry : first_seen_) {
    if (now_ms > entry.second + horizon_ms) expired.push_back(entry.first);
  }
  for (uint32_t id : expired) first_seen_.erase(id);
  return expired.size();
}

// evict_oldest() — linear scan; only runs when the cache is full.
void DedupCache::evict_oldest() {
  if (first_seen_.empty()) return;
  auto oldest = first_seen_.begin();
  for (auto it = first_seen_.begin(); it != first_seen_.end(); ++it) {
    if (it->second < oldest->second) oldest = it;
  }
  const uint32_t id = oldest->first;
  first_seen_.erase(id);
}

} // namespace viamesh
