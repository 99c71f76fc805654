#pragma once
/**
 * @file stream_key.hpp
 * @brief Keys for per-peer protocol state.
 *
 * A peer has two independent sequence spaces: one for reliable traffic and
 * one for unreliable traffic. StreamKey names one of them; RecordKey names a
 * single sequence inside it.
 */

#include "viamesh/types.hpp"
#include <stdint.h>

namespace viamesh {

struct StreamKey {
  HostStr host;
  bool    reliable{false};

  bool operator<(const StreamKey& o) const {
    if (reliable != o.reliable) return reliable < o.reliable;
    return host < o.host;
  }
  bool operator==(const StreamKey& o) const {
    return reliable == o.reliable && host == o.host;
  }
};

struct RecordKey {
  HostStr  host;
  bool     reliable{false};
  uint32_t sequence{0};

  StreamKey stream() const { return StreamKey{host, reliable}; }

  bool operator<(const RecordKey& o) const {
    if (reliable != o.reliable) return reliable < o.reliable;
    if (sequence != o.sequence) return sequence < o.sequence;
    return host < o.host;
  }
  bool operator==(const RecordKey& o) const {
    return reliable == o.reliable && sequence == o.sequence && host == o.host;
  }
};

} // namespace viamesh
