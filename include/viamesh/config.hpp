/**
 * @file config.hpp
 * @brief Settings for the viamesh tools: transport constants, medium choice, log level.
 *
 * @details
 * Settings come from three places, later ones winning:
 *  1. built-in defaults (the TransportConfig / MediumSettings initialisers),
 *  2. a JSON file (load_settings),
 *  3. command-line flags, applied by the tools themselves.
 *
 * File layout (every key optional):
 * @code
 * {
 *   "hostname": "BASE",
 *   "log_level": "info",
 *   "transport": {
 *     "mtu": 1024, "retransmit_ms": 3000, "drop_ms": 12000,
 *     "max_sequence": 4294967295, "forward": true, "rng_seed": 0
 *   },
 *   "medium": {
 *     "kind": "udp", "channel": 2048, "mtu": 1400,
 *     "bind_address": "0.0.0.0", "broadcast_address": "255.255.255.255",
 *     "device": "/dev/ttyACM0", "baud": 115200, "boot_delay_ms": 400
 *   },
 *   "bridge": [
 *     { "kind": "serial", "device": "/dev/ttyUSB0" }
 *   ]
 * }
 * @endcode
 *
 * Each "bridge" entry is one more medium the host joins (same keys as
 * "medium", unset keys take the built-in defaults). A relay on a UDP segment
 * and a serial radio at once joins the two meshes.
 */
#ifndef VIAMESH_CONFIG_HPP
#define VIAMESH_CONFIG_HPP

#include "viamesh/transport.hpp"
#include "viamesh/medium/medium_base.hpp"
#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

namespace viamesh {

struct MediumSettings {
  std::string kind{"udp"};                          ///< "udp", "serial"
  uint16_t    channel{2048};
  uint16_t    mtu{1400};
  std::string bind_address{"0.0.0.0"};
  std::string broadcast_address{"255.255.255.255"};
  std::string device{"/dev/ttyACM0"};
  int         baud{115200};
  int         boot_delay_ms{400};
};

struct Settings {
  TransportConfig             transport;
  MediumSettings              medium;
  std::vector<MediumSettings> bridges;    ///< extra media, joined with Transport::add_medium()
  std::string                 log_level{"info"};
};

enum class ConfigStatus : uint8_t {
  Ok = 0,
  NotFound,     ///< file missing or unreadable
  ParseError,   ///< not JSON
  BadValue      ///< JSON, but a key has the wrong type or an out-of-range value
};

const char* to_string(ConfigStatus s);

/**
 * @brief Apply the JSON document in @p text on top of @p out.
 *
 * Keys that are absent keep their current value. On failure @p out may be
 * partly updated and @p err names the offending key or the parser message.
 */
ConfigStatus parse_settings(const std::string& text, Settings& out, std::string& err);

/// Read @p path and apply it with parse_settings().
ConfigStatus load_settings(const std::string& path, Settings& out, std::string& err);

/**
 * @brief Create and start the medium named by @p ms.kind.
 * @return false if the kind is unknown or begin() failed (already logged)
 */
bool open_medium(const MediumSettings& ms, std::unique_ptr<medium::IMedium>& out);

} // namespace viamesh

#endif // VIAMESH_CONFIG_HPP
