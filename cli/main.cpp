// -----------------------------------------------------------------------------
// viamesh-cli — send and receive viamesh messages from a shell.
//
//   viamesh-cli --send BASE --port 10 --reliable --message "hello"
//   viamesh-cli --listen --count 1 --timeout 30000
//   viamesh-cli --medium serial --dev /dev/ttyACM0 --listen
//
// Output: one key=value line per event on stdout; failures as
// "status=error reason=<token>" on stderr with a non-zero exit code.
// -----------------------------------------------------------------------------
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "cli_options.hpp"
#include "viamesh/config.hpp"
#include "viamesh/log.hpp"
#include "viamesh/transport.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <string>

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace viamesh;

// ---------- identity ----------

static fs::path default_state_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return fs::path(xdg) / "viamesh";
  const char* home = std::getenv("HOME");
  return fs::path(home ? home : ".") / ".config" / "viamesh";
}

// Callsign: six of A-Z 0-9.
static std::string random_callsign() {
  static const char* ALPH = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> pick(0, 35);
  std::string s;
  for (int i = 0; i < 6; ++i) s.push_back(ALPH[pick(gen)]);
  return s;
}

static json read_json_file(const fs::path& p) {
  std::ifstream in(p);
  if (!in) return json::object();
  try {
    json j;
    in >> j;
    return j.is_object() ? j : json::object();
  } catch (const json::exception& e) {
    log::logger()->warn("identity: ignoring {}: {}", p.string(), e.what());
    return json::object();
  }
}

static bool atomic_write_json(const fs::path& p, const json& j) {
  std::error_code ec;
  fs::create_directories(p.parent_path(), ec);
  if (ec) return false;
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return false;
    out << j.dump(2);
    if (!out.flush()) return false;
  }
  fs::rename(tmp, p, ec);
  return !ec;
}

// ----- resolve_identity()
// POLICY: identity.json wins over generation; a generated callsign is
// persisted so the next run is the same host.
static bool resolve_identity(std::string& host, bool& generated) {
  generated = false;
  const fs::path file = default_state_dir() / "identity.json";
  json st = read_json_file(file);
  if (st.contains("hostname") && st["hostname"].is_string()) {
    host = st["hostname"].get<std::string>();
    if (is_valid_host(host.c_str())) return true;
    log::logger()->warn("identity: invalid hostname in {}, generating a new one", file.string());
  }

  host = random_callsign();
  generated = true;
  st["hostname"] = host;
  if (!atomic_write_json(file, st)) {
    log::logger()->warn("identity: cannot write {}", file.string());
  }
  return true;
}

static uint64_t now_ms_steady() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"viamesh CLI"};
  cli::CliOptions opt;
  cli::add_options(app, opt);

  CLI11_PARSE(app, argc, argv);
  cli::finish_options(opt);

  if (opt.send.empty() && !opt.listen) {
    std::cerr << "status=error reason=need_send_or_listen\n";
    return 2;
  }

  // -------- settings: defaults < file < flags --------
  Settings settings;
  if (!opt.config.empty()) {
    std::string err;
    ConfigStatus cs = load_settings(opt.config, settings, err);
    if (cs != ConfigStatus::Ok) {
      std::cerr << "status=error reason=config_" << to_string(cs) << " detail=" << err << "\n";
      return 2;
    }
  }
  cli::apply_options(opt, settings);

  if (!log::set_level(settings.log_level)) {
    std::cerr << "status=error reason=bad_log_level\n";
    return 2;
  }

  if (opt.o_host->count()) {
    if (!is_valid_host(opt.host.c_str())) {
      std::cerr << "status=error reason=bad_host\n";
      return 2;
    }
    settings.transport.hostname.assign(opt.host.c_str());
  }
  if (settings.transport.hostname.empty()) {
    std::string host;
    bool generated = false;
    resolve_identity(host, generated);
    settings.transport.hostname.assign(host.c_str());
    if (generated) std::cout << "id=" << host << " generated=1\n";
  }

  // -------- medium + transport --------
  std::unique_ptr<medium::IMedium> link;
  if (!open_medium(settings.medium, link)) {
    std::cerr << "status=error reason=medium_open_failed medium=" << settings.medium.kind << "\n";
    return 1;
  }

  SteadyClock clock;
  Transport mesh(settings.transport, *link, clock);
  mesh.set_connection_lost_handler([](const Handle& h, uint16_t port, const std::string&) {
    std::cerr << "status=lost host=" << h.host.c_str() << " seq=" << h.sequence
              << " port=" << port << "\n";
  });

  int rc = 0;

  // -------- send --------
  if (!opt.send.empty()) {
    SendResult r = mesh.send(opt.send.c_str(), opt.port, opt.message, opt.reliable, opt.wait);
    if (!r.ok()) {
      std::cerr << "status=error reason=" << to_string(r.status) << "\n";
      if (!opt.listen) return 3;
      rc = 3;
    } else {
      std::cout << "status=" << (opt.reliable && opt.wait ? "acked" : "sent")
                << " host=" << opt.send
                << " port=" << opt.port
                << " len=" << opt.message.size();
      if (r.handle.valid()) std::cout << " seq=" << r.handle.sequence;
      std::cout << "\n";
    }
  }

  // -------- listen --------
  if (opt.listen) {
    const uint64_t start = now_ms_steady();
    uint32_t got = 0;
    Delivery d;
    for (;;) {
      if (opt.count && got >= opt.count) break;
      if (opt.timeout_ms && now_ms_steady() - start >= opt.timeout_ms) break;
      if (!mesh.receive(100, d)) continue;
      ++got;
      std::cout << "from=" << d.host.c_str()
                << " port=" << d.port
                << " len=" << d.message.size()
                << " message=" << d.message << "\n"
                << std::flush;
    }
    if (opt.count && got < opt.count) {
      std::cerr << "status=error reason=timeout received=" << got << "\n";
      return 3;
    }
  }

  return rc;
}
