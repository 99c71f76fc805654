#pragma once
/**
 * @file medium_base.hpp
 * @brief Link-layer seam: a shared broadcast medium the transport talks through.
 *
 * Header-only. A medium moves opaque frames; it knows nothing about hosts,
 * sequences or acks. Everything it hears goes up, everything sent goes to
 * every neighbour in range.
 */

#include <cstddef>
#include <cstdint>

namespace viamesh::medium {

enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

struct Config {
  // Per-medium settings extend this (see UdpConfig, SerialConfig).
  uint16_t mtu{1400};       // largest frame the link carries
  uint16_t channel{2048};   // shared application channel (UDP port for UdpMedium)
};

/**
 * @brief Broadcast medium trait.
 *
 * Contract:
 *  - begin(cfg) opens the link. False means nothing else will work.
 *  - broadcast(buf,len) sends one frame to all neighbours; never blocks for long.
 *  - wait(out,cap,len,timeout_ms) blocks up to timeout_ms for one frame.
 *    Ok with len>0 on a frame, None on timeout, Error on a link failure.
 *  - name() is a short identifier for logs.
 *  - mtu() is the largest frame broadcast() accepts.
 */
class IMedium {
public:
  virtual ~IMedium() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual TxResult    broadcast(const uint8_t* data, std::size_t len) = 0;
  virtual RxResult    wait(uint8_t* out, std::size_t cap, std::size_t& out_len, uint32_t timeout_ms) = 0;
  virtual const char* name() const = 0;
  virtual std::size_t mtu() const = 0;
};

inline const char* to_string(TxResult r) {
  switch (r) {
    case TxResult::Ok:   return "ok";
    case TxResult::Busy: return "busy";
    default:             return "error";
  }
}

} // namespace viamesh::medium
