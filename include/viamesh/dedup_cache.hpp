/**
 * @file dedup_cache.hpp
 * @brief DedupCache — packet ids seen recently, aged out by the drop horizon.
 *
 * @details
 * Flooding means every frame comes back around: from each neighbour that
 * relays it, and as the echo of our own broadcast. The cache remembers each
 * packet id with the time it was first seen; anything seen before is dropped
 * before the receive engine looks at it.
 *
 * Bounded: when the cache is full, recording a new id evicts the oldest one.
 * A burst larger than the cache can therefore let a very old duplicate through;
 * the sequence layer still rejects it for reliable streams.
 */
#ifndef VIAMESH_DEDUP_CACHE_HPP
#define VIAMESH_DEDUP_CACHE_HPP

#include "etl/map.h"
#include <stdint.h>
#include <stddef.h>

namespace viamesh {

class DedupCache {
public:
  static constexpr size_t CAPACITY = 256;   ///< Max ids remembered

  /// True if @p id was recorded and not yet evicted.
  bool seen(uint32_t id) const;

  /// Remember @p id as seen at @p now_ms. Keeps the first-seen time if already present.
  void record(uint32_t id, uint64_t now_ms);

  /**
   * @brief Drop ids first seen more than @p horizon_ms before @p now_ms.
   * @return number of ids removed
   */
  size_t evict(uint64_t now_ms, uint64_t horizon_ms);

  size_t size() const { return first_seen_.size(); }
  void clear() { first_seen_.clear(); }

private:
  void evict_oldest();

  etl::map<uint32_t, uint64_t, CAPACITY> first_seen_;
};

} // namespace viamesh

#endif // VIAMESH_DEDUP_CACHE_HPP
