// -----------------------------------------------------------------------------
// frame.cpp — stamp encoder/decoder for viamesh frames
//
// API & field table: see include/viamesh/frame.hpp
//
// Decoder policy: split on the first six '~' only; the payload keeps any '~'
// it carries. Numeric fields are strict (digits only, range checked).
// -----------------------------------------------------------------------------
#include "viamesh/frame.hpp"
#include <string.h>

namespace viamesh {

namespace {

static constexpr uint8_t SEP = '~';
static constexpr size_t  FIELD_COUNT = 7;

struct Span {
  const uint8_t* ptr{nullptr};
  size_t len{0};
};

bool push(FrameBytes& out, uint8_t b) {
  if (out.full()) return false;
  out.push_back(b);
  return true;
}

bool push_bytes(FrameBytes& out, const char* s, size_t n) {
  if (out.available() < n) return false;
  for (size_t i = 0; i < n; ++i) out.push_back(static_cast<uint8_t>(s[i]));
  return true;
}

bool push_decimal(FrameBytes& out, uint32_t v) {
  char digits[10];
  size_t n = 0;
  do {
    digits[n++] = static_cast<char>('0' + (v % 10));
    v /= 10;
  } while (v != 0);
  while (n > 0) {
    if (!push(out, static_cast<uint8_t>(digits[--n]))) return false;
  }
  return true;
}

bool push_hex8(FrameBytes& out, uint32_t v) {
  static const char HEX[] = "0123456789ABCDEF";
  for (int shift = 28; shift >= 0; shift -= 4) {
    if (!push(out, static_cast<uint8_t>(HEX[(v >> shift) & 0xF]))) return false;
  }
  return true;
}

bool parse_decimal(const Span& s, uint64_t max, uint64_t& out) {
  if (s.len == 0 || s.len > 10) return false;
  uint64_t v = 0;
  for (size_t i = 0; i < s.len; ++i) {
    const uint8_t c = s.ptr[i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  if (v > max) return false;
  out = v;
  return true;
}

bool parse_hex8(const Span& s, uint32_t& out) {
  if (s.len != 8) return false;
  uint32_t v = 0;
  for (size_t i = 0; i < 8; ++i) {
    const uint8_t c = s.ptr[i];
    uint32_t nibble;
    if      (c >= '0' && c <= '9') nibble = c - '0';
    else if (c >= 'A' && c <= 'F') nibble = c - 'A' + 10;
    else if (c >= 'a' && c <= 'f') nibble = c - 'a' + 10;
    else return false;
    v = (v << 4) | nibble;
  }
  out = v;
  return true;
}

bool parse_host(const Span& s, HostStr& out) {
  if (s.len == 0 || s.len > VM_HOST_MAX) return false;
  out.assign(reinterpret_cast<const char*>(s.ptr), s.len);
  return true;
}

} // namespace

bool is_valid_host(const char* host) {
  if (!host) return false;
  const size_t n = strlen(host);
  if (n == 0 || n > VM_HOST_MAX) return false;
  return memchr(host, SEP, n) == nullptr;
}

const char* to_string(FrameStatus s) {
  switch (s) {
    case FrameStatus::Ok:           return "ok";
    case FrameStatus::MissingField: return "missing_field";
    case FrameStatus::BadId:        return "bad_id";
    case FrameStatus::BadSequence:  return "bad_sequence";
    case FrameStatus::BadFlags:     return "bad_flags";
    case FrameStatus::BadHost:      return "bad_host";
    case FrameStatus::BadPort:      return "bad_port";
    case FrameStatus::Oversize:     return "oversize";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// encode_frame()
// PRE:  hosts are valid (checked again here; a '~' in a host would corrupt the stamp).
// OUT:  out holds the full stamp; false leaves it partially written.
// -----------------------------------------------------------------------------
bool encode_frame(const Frame& f, FrameBytes& out) {
  out.clear();
  if (!is_valid_host(f.destination.c_str()) || !is_valid_host(f.source.c_str())) return false;

  const PacketFlags::Token flags = f.flags.to_token();

  return push_hex8(out, f.id) && push(out, SEP) &&
         push_decimal(out, f.sequence) && push(out, SEP) &&
         push_bytes(out, flags.data(), flags.size()) && push(out, SEP) &&
         push_bytes(out, f.destination.data(), f.destination.size()) && push(out, SEP) &&
         push_bytes(out, f.source.data(), f.source.size()) && push(out, SEP) &&
         push_decimal(out, f.port) && push(out, SEP) &&
         push_bytes(out, f.payload.data(), f.payload.size());
}

// -----------------------------------------------------------------------------
// decode_frame()
// POLICY:
//   - First pass: locate the six separators. The payload is the remainder.
//   - Then validate fields left to right; first failure wins.
// -----------------------------------------------------------------------------
FrameStatus decode_frame(const uint8_t* data, size_t len, Frame& out) {
  Span fields[FIELD_COUNT];
  size_t field = 0;
  size_t start = 0;

  for (size_t i = 0; i < len && field < FIELD_COUNT - 1; ++i) {
    if (data[i] == SEP) {
      fields[field].ptr = data + start;
      fields[field].len = i - start;
      ++field;
      start = i + 1;
    }
  }
  if (field < FIELD_COUNT - 1) return FrameStatus::MissingField;

  fields[FIELD_COUNT - 1].ptr = data + start;
  fields[FIELD_COUNT - 1].len = len - start;

  uint64_t number = 0;

  if (!parse_hex8(fields[0], out.id)) return FrameStatus::BadId;

  if (!parse_decimal(fields[1], 0xFFFFFFFFull, number)) return FrameStatus::BadSequence;
  out.sequence = static_cast<uint32_t>(number);

  if (!PacketFlags::parse(reinterpret_cast<const char*>(fields[2].ptr), fields[2].len, out.flags)) {
    return FrameStatus::BadFlags;
  }

  if (!parse_host(fields[3], out.destination)) return FrameStatus::BadHost;
  if (!parse_host(fields[4], out.source))      return FrameStatus::BadHost;

  if (!parse_decimal(fields[5], 0xFFFFull, number)) return FrameStatus::BadPort;
  out.port = static_cast<uint16_t>(number);

  if (fields[6].len > VM_PAYLOAD_MAX) return FrameStatus::Oversize;
  out.payload.assign(reinterpret_cast<const char*>(fields[6].ptr), fields[6].len);

  return FrameStatus::Ok;
}

} // namespace viamesh
