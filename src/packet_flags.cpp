// -----------------------------------------------------------------------------
// packet_flags.cpp — flags token parse/format
//
// Token grammar: one or more <letter><decimal> pairs, letters s r a f.
// API & token table: see include/viamesh/packet_flags.hpp
// -----------------------------------------------------------------------------
#include "viamesh/packet_flags.hpp"

namespace viamesh {

namespace {

// append_u16() — decimal digits of v, no padding.
void append_u16(PacketFlags::Token& out, uint16_t v) {
  char digits[6];
  size_t n = 0;
  do {
    digits[n++] = static_cast<char>('0' + (v % 10));
    v = static_cast<uint16_t>(v / 10);
  } while (v != 0);
  while (n > 0) out += digits[--n];
}

} // namespace

PacketFlags::Token PacketFlags::to_token() const {
  Token out;
  if (syn)                 out += "s1";
  if (requires_ack)        out += "r1";
  if (ack)                 out += "a1";
  if (more_fragments)      out += "f0";
  else if (fragment_count) { out += 'f'; append_u16(out, fragment_count); }
  return out;
}

// -----------------------------------------------------------------------------
// parse() — PRE: s points at len bytes of token, nothing else.
// POLICY:
//   - Each letter must be followed by at least one digit.
//   - s/r/a accept any value; nonzero means set.
//   - f0 and f<n> in one token contradict each other: reject.
//   - Values above 65535 are rejected rather than truncated.
// -----------------------------------------------------------------------------
bool PacketFlags::parse(const char* s, size_t len, PacketFlags& out) {
  out = PacketFlags();
  bool seen_f = false;
  size_t i = 0;

  while (i < len) {
    const char letter = s[i++];
    if (i >= len || s[i] < '0' || s[i] > '9') return false;   // letter without number

    uint32_t value = 0;
    while (i < len && s[i] >= '0' && s[i] <= '9') {
      value = value * 10 + static_cast<uint32_t>(s[i++] - '0');
      if (value > 0xFFFFu) return false;
    }

    switch (letter) {
      case 's': out.syn = value != 0; break;
      case 'r': out.requires_ack = value != 0; break;
      case 'a': out.ack = value != 0; break;
      case 'f':
        if (seen_f) return false;
        seen_f = true;
        if (value == 0) out.more_fragments = true;
        else            out.fragment_count = static_cast<uint16_t>(value);
        break;
      default:
        return false;                                      // unknown marker
    }
  }
  return true;
}

} // namespace viamesh
