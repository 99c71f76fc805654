/**
 * @file packet_flags.hpp
 * @brief PacketFlags — the marker set carried by every viamesh frame.
 *
 * @details
 * On the wire, flags travel as a short token of letter/number pairs. Inside
 * the transport they are a plain struct; the token is parsed exactly once when
 * a frame comes off the medium and formatted exactly once when a frame goes out.
 *
 * | Token  | Field                 | Meaning                                         |
 * |--------|-----------------------|-------------------------------------------------|
 * | `s1`   | `syn`                 | first packet of a fresh logical connection      |
 * | `r1`   | `requires_ack`        | sender wants a cumulative acknowledgment        |
 * | `a1`   | `ack`                 | frame is an acknowledgment, payload empty       |
 * | `f0`   | `more_fragments`      | non-terminal fragment of a larger message       |
 * | `f<n>` | `fragment_count = n`  | terminal fragment; n fragments in the chain     |
 *
 * Tokens may appear in any order on input. Output order is always s, r, a, f.
 * A pair with value 0 (e.g. `s0`) is accepted and means "not set".
 *
 * @code
 * viamesh::PacketFlags f;
 * f.requires_ack = true;
 * f.fragment_count = 3;
 * auto tok = f.to_token();          // "r1f3"
 *
 * viamesh::PacketFlags back;
 * viamesh::PacketFlags::parse(tok.c_str(), tok.size(), back);
 * @endcode
 */
#ifndef VIAMESH_PACKET_FLAGS_HPP
#define VIAMESH_PACKET_FLAGS_HPP

#include "viamesh/types.hpp"
#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>

namespace viamesh {

struct PacketFlags {
  using Token = etl::string<VM_FLAGS_MAX>;

  bool     syn{false};            ///< s1
  bool     requires_ack{false};   ///< r1
  bool     ack{false};            ///< a1
  bool     more_fragments{false}; ///< f0
  uint16_t fragment_count{0};     ///< f<n>, n > 0 on the terminal fragment only

  /// True for any piece of a fragment chain (terminal or not).
  bool fragmented() const { return more_fragments || fragment_count > 0; }

  /// Acks and ack-requesting frames belong to the reliable stream of their peer.
  bool reliable() const { return requires_ack || ack; }

  /// Format as a wire token, canonical order.
  Token to_token() const;

  /**
   * @brief Parse a wire token.
   * @param s   token bytes (not necessarily null terminated)
   * @param len number of bytes at @p s
   * @param out receives the parsed flags; reset first
   * @return false on an unknown letter, a missing number, or f0 combined with f<n>
   */
  static bool parse(const char* s, size_t len, PacketFlags& out);

  bool operator==(const PacketFlags& o) const {
    return syn == o.syn && requires_ack == o.requires_ack && ack == o.ack &&
           more_fragments == o.more_fragments && fragment_count == o.fragment_count;
  }
  bool operator!=(const PacketFlags& o) const { return !(*this == o); }
};

} // namespace viamesh

#endif // VIAMESH_PACKET_FLAGS_HPP
