#pragma once
/**
 * @file sequence.hpp
 * @brief Wrapping sequence arithmetic over [1, max].
 *
 * Sequence 0 never names a packet; acks use it for "nothing in order yet".
 */

#include <stdint.h>

namespace viamesh::seq {

/// Successor of @p s, wrapping max back to 1. next(0) == 1.
inline uint32_t next(uint32_t s, uint32_t max) {
  return static_cast<uint32_t>(static_cast<uint64_t>(s) % max + 1);
}

/// Predecessor of @p s, wrapping 1 back to max.
inline uint32_t prev(uint32_t s, uint32_t max) {
  const uint64_t m = max;
  return static_cast<uint32_t>((static_cast<uint64_t>(s) + 2 * m - 2) % m + 1);
}

/// How many next() steps lead from @p from to @p to. ahead(s, s) == 0.
inline uint32_t ahead(uint32_t from, uint32_t to, uint32_t max) {
  return to >= from ? to - from : max - from + to;
}

} // namespace viamesh::seq
