#pragma once
/**
 * @file cli_options.hpp
 * @brief Command-line options of viamesh-cli and how they combine with a settings file.
 *
 * Header-only so the option rules are testable without running the tool.
 */

#include <CLI/CLI.hpp>

#include "viamesh/config.hpp"

#include <cstdint>
#include <string>

namespace viamesh::cli {

struct CliOptions {
  std::string config;
  std::string host;
  uint16_t    channel = 2048;
  std::string medium = "udp";
  std::string bind;
  std::string bcast;
  std::string dev;
  int         baud = 115200;
  std::string log_level;

  std::string send;
  uint16_t    port = 0;
  bool        reliable = false;
  bool        wait = false;
  std::string message;

  bool     listen = false;
  uint32_t count = 0;
  uint32_t timeout_ms = 0;

  // set when the flag was given, so a file value is only overridden on purpose
  CLI::Option* o_host = nullptr;
  CLI::Option* o_channel = nullptr;
  CLI::Option* o_medium = nullptr;
  CLI::Option* o_bind = nullptr;
  CLI::Option* o_bcast = nullptr;
  CLI::Option* o_dev = nullptr;
  CLI::Option* o_baud = nullptr;
};

inline void add_options(CLI::App& app, CliOptions& o) {
  app.add_option("--config", o.config, "JSON settings file");
  o.o_host    = app.add_option("--host", o.host, "This host's name (default: persisted callsign)");
  o.o_channel = app.add_option("--channel", o.channel, "Shared channel (UDP port)");
  o.o_medium  = app.add_option("--medium", o.medium, "Broadcast medium")
                    ->check(CLI::IsMember({"udp", "serial"}));
  o.o_bind    = app.add_option("--bind", o.bind, "UDP bind address");
  o.o_bcast   = app.add_option("--broadcast-addr", o.bcast, "UDP broadcast address");
  o.o_dev     = app.add_option("--dev", o.dev, "Serial device (e.g. /dev/serial/by-id/...)");
  o.o_baud    = app.add_option("--baud", o.baud, "Serial baud rate");
  app.add_option("--log-level", o.log_level, "trace|debug|info|warn|error|critical|off");

  app.add_option("--send", o.send, "Destination host, '*' for broadcast");
  app.add_option("--port", o.port, "Application port");
  app.add_flag("--reliable", o.reliable, "In-order, exactly-once delivery (waits for the ack)");
  app.add_flag("--wait", o.wait, "Block until acknowledged or dropped; implied by --reliable");
  app.add_option("--message", o.message, "Message body");

  app.add_flag("--listen", o.listen, "Print incoming messages");
  app.add_option("--count", o.count, "With --listen: stop after N messages (0 = no limit)");
  app.add_option("--timeout", o.timeout_ms, "With --listen: stop after N ms (0 = no limit)");
}

/**
 * @brief Settle option combinations after parsing.
 *
 * The tool exits right after sending, and nothing retransmits once the
 * process is gone, so a reliable send always waits for its ack.
 */
inline void finish_options(CliOptions& o) {
  if (o.reliable) o.wait = true;
}

/// Flags that were given override @p s (defaults < file < flags).
inline void apply_options(const CliOptions& o, Settings& s) {
  if (o.o_channel && o.o_channel->count()) s.medium.channel = o.channel;
  if (o.o_medium && o.o_medium->count())   s.medium.kind = o.medium;
  if (o.o_bind && o.o_bind->count())       s.medium.bind_address = o.bind;
  if (o.o_bcast && o.o_bcast->count())     s.medium.broadcast_address = o.bcast;
  if (o.o_dev && o.o_dev->count())         s.medium.device = o.dev;
  if (o.o_baud && o.o_baud->count())       s.medium.baud = o.baud;
  if (!o.log_level.empty()) s.log_level = o.log_level;
}

} // namespace viamesh::cli
