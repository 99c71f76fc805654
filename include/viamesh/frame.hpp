/**
 * @file frame.hpp
 * @brief Frame — one viamesh packet and its text stamp on the medium.
 *
 * @details
 * Every frame on the medium is a single stamp of seven fields separated by '~':
 *
 * ```
 * <id:8 hex>~<sequence:decimal>~<flags>~<destination>~<source>~<port:decimal>~<payload>
 * ```
 *
 * Example: `0A1B2C3D~17~r1f0~BASE~NODE7~2048~hello wo`
 *
 * - **id**: random 32-bit packet id, upper-case hex, zero padded. Dedup key.
 * - **sequence**: decimal, 0..4294967295. 0 only appears in acks.
 * - **flags**: token from PacketFlags, may be empty.
 * - **destination / source**: hostnames, no '~'. Destination may be "*".
 * - **port**: decimal application port 0..65535.
 * - **payload**: everything after the sixth '~', any bytes including '~' and NUL.
 *
 * Decoding never throws and never allocates. Malformed input returns a
 * FrameStatus other than Ok and leaves the output undefined.
 */
#ifndef VIAMESH_FRAME_HPP
#define VIAMESH_FRAME_HPP

#include "viamesh/types.hpp"
#include "viamesh/packet_flags.hpp"
#include "etl/vector.h"
#include <stdint.h>
#include <stddef.h>

namespace viamesh {

/// Encoded frame bytes, sized for the worst case stamp.
using FrameBytes = etl::vector<uint8_t, VM_FRAME_MAX>;

struct Frame {
  uint32_t    id{0};
  uint32_t    sequence{0};
  PacketFlags flags;
  HostStr     destination;
  HostStr     source;
  uint16_t    port{0};
  PayloadStr  payload;
};

enum class FrameStatus : uint8_t {
  Ok = 0,
  MissingField,   ///< fewer than six separators
  BadId,          ///< id is not exactly 8 hex digits
  BadSequence,    ///< not decimal or out of range
  BadFlags,       ///< flags token rejected by PacketFlags::parse
  BadHost,        ///< empty or oversized destination/source
  BadPort,        ///< not decimal or above 65535
  Oversize        ///< payload longer than VM_PAYLOAD_MAX
};

/// Short lower-case token for logs, e.g. "bad_id".
const char* to_string(FrameStatus s);

/**
 * @brief Encode @p f as a stamp into @p out (cleared first).
 * @return false if a host is invalid or the result would not fit.
 */
bool encode_frame(const Frame& f, FrameBytes& out);

/**
 * @brief Decode a stamp.
 * @param data bytes as read from the medium
 * @param len  number of bytes
 * @param out  receives the frame when the result is FrameStatus::Ok
 */
FrameStatus decode_frame(const uint8_t* data, size_t len, Frame& out);

} // namespace viamesh

#endif // VIAMESH_FRAME_HPP
