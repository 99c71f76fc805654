// -----------------------------------------------------------------------------
// viamesh-relay — keeps a host on the mesh: floods frames onward, answers
// reliable senders, prints what is addressed to it.
//
//   viamesh-relay --host HILL1 --medium serial --dev /dev/ttyACM0
//   viamesh-relay --host GATE --medium udp --bridge-dev /dev/ttyUSB0
//
// With --bridge-dev (or "bridge" entries in the config file) the relay sits on
// several media at once and floods between them.
//
// Output: "from=... port=... len=... message=..." per delivery and a
// "stats ..." line every --stats-interval ms on stdout.
// -----------------------------------------------------------------------------
#include <CLI/CLI.hpp>

#include "viamesh/config.hpp"
#include "viamesh/log.hpp"
#include "viamesh/transport.hpp"

#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace viamesh;

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

static void print_stats(const TransportStats& s) {
  std::cout << "stats sent=" << s.frames_sent
            << " received=" << s.frames_received
            << " forwarded=" << s.frames_forwarded
            << " malformed=" << s.frames_malformed
            << " duplicates=" << s.duplicates_dropped
            << " retransmits=" << s.retransmissions
            << " timeouts=" << s.timeouts
            << " desyncs=" << s.desyncs_repaired
            << " delivered=" << s.messages_delivered << "\n"
            << std::flush;
}

int main(int argc, char** argv) {
  CLI::App app{"viamesh relay"};

  std::string opt_config;
  std::string opt_host;
  uint16_t    opt_channel = 2048;
  std::string opt_medium = "udp";
  std::string opt_dev;
  int         opt_baud = 115200;
  std::string opt_log_level;
  uint32_t    opt_stats_ms = 60000;
  std::vector<std::string> opt_bridge_devs;
  int         opt_bridge_baud = 115200;

  app.add_option("--config", opt_config, "JSON settings file");
  auto* o_host    = app.add_option("--host", opt_host, "This host's name");
  auto* o_channel = app.add_option("--channel", opt_channel, "Shared channel (UDP port)");
  auto* o_medium  = app.add_option("--medium", opt_medium, "Broadcast medium")
                        ->check(CLI::IsMember({"udp", "serial"}));
  auto* o_dev     = app.add_option("--dev", opt_dev, "Serial device");
  auto* o_baud    = app.add_option("--baud", opt_baud, "Serial baud rate");
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|critical|off");
  app.add_option("--stats-interval", opt_stats_ms, "Print counters every N ms (0 = never)");
  app.add_option("--bridge-dev", opt_bridge_devs, "Also join a serial radio on this device (repeatable)");
  app.add_option("--bridge-baud", opt_bridge_baud, "Baud rate for --bridge-dev");

  CLI11_PARSE(app, argc, argv);

  Settings settings;
  if (!opt_config.empty()) {
    std::string err;
    ConfigStatus cs = load_settings(opt_config, settings, err);
    if (cs != ConfigStatus::Ok) {
      std::cerr << "status=error reason=config_" << to_string(cs) << " detail=" << err << "\n";
      return 2;
    }
  }
  if (o_host->count()) {
    if (!is_valid_host(opt_host.c_str())) {
      std::cerr << "status=error reason=bad_host\n";
      return 2;
    }
    settings.transport.hostname.assign(opt_host.c_str());
  }
  if (o_channel->count()) settings.medium.channel = opt_channel;
  if (o_medium->count())  settings.medium.kind = opt_medium;
  if (o_dev->count())     settings.medium.device = opt_dev;
  if (o_baud->count())    settings.medium.baud = opt_baud;
  if (!opt_log_level.empty()) settings.log_level = opt_log_level;
  for (const std::string& dev : opt_bridge_devs) {
    MediumSettings ms;
    ms.kind = "serial";
    ms.device = dev;
    ms.baud = opt_bridge_baud;
    settings.bridges.push_back(ms);
  }
  settings.transport.forward = true;

  if (settings.transport.hostname.empty()) {
    std::cerr << "status=error reason=need_host\n";
    return 2;
  }
  if (!log::set_level(settings.log_level)) {
    std::cerr << "status=error reason=bad_log_level\n";
    return 2;
  }

  std::unique_ptr<medium::IMedium> link;
  if (!open_medium(settings.medium, link)) {
    std::cerr << "status=error reason=medium_open_failed medium=" << settings.medium.kind << "\n";
    return 1;
  }

  std::vector<std::unique_ptr<medium::IMedium>> bridges;
  for (const MediumSettings& ms : settings.bridges) {
    std::unique_ptr<medium::IMedium> extra;
    if (!open_medium(ms, extra)) {
      std::cerr << "status=error reason=medium_open_failed medium=" << ms.kind << "\n";
      return 1;
    }
    bridges.push_back(std::move(extra));
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  SteadyClock clock;
  Transport mesh(settings.transport, *link, clock);
  for (auto& extra : bridges) {
    if (!mesh.add_medium(*extra)) {
      std::cerr << "status=error reason=too_many_media\n";
      return 2;
    }
  }
  log::logger()->info("relay {} on {} channel {} (+{} bridged)", settings.transport.hostname.c_str(),
                      link->name(), settings.medium.channel, bridges.size());

  uint64_t last_stats = clock.now_ms();
  Delivery d;
  while (!g_stop) {
    if (mesh.receive(200, d)) {
      std::cout << "from=" << d.host.c_str()
                << " port=" << d.port
                << " len=" << d.message.size()
                << " message=" << d.message << "\n"
                << std::flush;
    }
    const uint64_t now = clock.now_ms();
    if (opt_stats_ms && now - last_stats >= opt_stats_ms) {
      print_stats(mesh.stats());
      last_stats = now;
    }
  }

  print_stats(mesh.stats());
  for (auto& extra : bridges) extra->end();
  link->end();
  return 0;
}
