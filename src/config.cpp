// -----------------------------------------------------------------------------
// config.cpp — JSON settings loader and medium factory
// Layout of the file: see include/viamesh/config.hpp
// -----------------------------------------------------------------------------
#include "viamesh/config.hpp"
#include "viamesh/log.hpp"
#include "viamesh/medium/medium_udp.hpp"
#include "viamesh/medium/medium_serial.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace viamesh {

namespace {

// ----- get_uint()
// PRE: key may be absent (then out is untouched).
// POLICY: must be an unsigned JSON integer no larger than max.
template <typename T>
bool get_uint(const json& obj, const char* key, T& out, std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_number_unsigned() ||
      it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
    err = key;
    return false;
  }
  out = static_cast<T>(it->get<uint64_t>());
  return true;
}

bool get_int(const json& obj, const char* key, int& out, std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_number_integer()) { err = key; return false; }
  const int64_t v = it->get<int64_t>();
  if (v < 0 || v > std::numeric_limits<int>::max()) { err = key; return false; }
  out = static_cast<int>(v);
  return true;
}

bool get_bool(const json& obj, const char* key, bool& out, std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_boolean()) { err = key; return false; }
  out = it->get<bool>();
  return true;
}

bool get_string(const json& obj, const char* key, std::string& out, std::string& err) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_string()) { err = key; return false; }
  out = it->get<std::string>();
  return true;
}

bool apply_transport(const json& t, TransportConfig& cfg, std::string& err) {
  return get_uint(t, "mtu", cfg.mtu, err) &&
         get_uint(t, "retransmit_ms", cfg.retransmit_ms, err) &&
         get_uint(t, "drop_ms", cfg.drop_ms, err) &&
         get_uint(t, "max_sequence", cfg.max_sequence, err) &&
         get_bool(t, "forward", cfg.forward, err) &&
         get_uint(t, "rng_seed", cfg.rng_seed, err);
}

bool apply_medium(const json& m, MediumSettings& ms, std::string& err) {
  if (!(get_string(m, "kind", ms.kind, err) &&
        get_uint(m, "channel", ms.channel, err) &&
        get_uint(m, "mtu", ms.mtu, err) &&
        get_string(m, "bind_address", ms.bind_address, err) &&
        get_string(m, "broadcast_address", ms.broadcast_address, err) &&
        get_string(m, "device", ms.device, err) &&
        get_int(m, "baud", ms.baud, err) &&
        get_int(m, "boot_delay_ms", ms.boot_delay_ms, err))) {
    return false;
  }
  if (ms.kind != "udp" && ms.kind != "serial") { err = "kind"; return false; }
  return true;
}

} // namespace

const char* to_string(ConfigStatus s) {
  switch (s) {
    case ConfigStatus::Ok:         return "ok";
    case ConfigStatus::NotFound:   return "not_found";
    case ConfigStatus::ParseError: return "parse_error";
    case ConfigStatus::BadValue:   return "bad_value";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parse_settings()
// POLICY:
//   - Unknown keys are ignored (files may carry settings for other tools).
//   - hostname must pass is_valid_host(); log_level must be an spdlog level.
// -----------------------------------------------------------------------------
ConfigStatus parse_settings(const std::string& text, Settings& out, std::string& err) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error& e) {
    err = e.what();
    return ConfigStatus::ParseError;
  }
  if (!doc.is_object()) { err = "root"; return ConfigStatus::BadValue; }

  std::string host;
  if (!get_string(doc, "hostname", host, err)) return ConfigStatus::BadValue;
  if (doc.contains("hostname")) {
    if (!is_valid_host(host.c_str())) { err = "hostname"; return ConfigStatus::BadValue; }
    out.transport.hostname.assign(host.c_str());
  }

  if (!get_string(doc, "log_level", out.log_level, err)) return ConfigStatus::BadValue;
  if (spdlog::level::from_str(out.log_level) == spdlog::level::off && out.log_level != "off") {
    err = "log_level";
    return ConfigStatus::BadValue;
  }

  auto t = doc.find("transport");
  if (t != doc.end()) {
    if (!t->is_object()) { err = "transport"; return ConfigStatus::BadValue; }
    if (!apply_transport(*t, out.transport, err)) return ConfigStatus::BadValue;
  }

  auto m = doc.find("medium");
  if (m != doc.end()) {
    if (!m->is_object()) { err = "medium"; return ConfigStatus::BadValue; }
    if (!apply_medium(*m, out.medium, err)) return ConfigStatus::BadValue;
  }

  auto b = doc.find("bridge");
  if (b != doc.end()) {
    if (!b->is_array() || b->size() + 1 > Transport::MEDIA_CAP) { err = "bridge"; return ConfigStatus::BadValue; }
    out.bridges.clear();
    for (const json& entry : *b) {
      if (!entry.is_object()) { err = "bridge"; return ConfigStatus::BadValue; }
      MediumSettings ms;
      if (!apply_medium(entry, ms, err)) return ConfigStatus::BadValue;
      out.bridges.push_back(ms);
    }
  }
  return ConfigStatus::Ok;
}

ConfigStatus load_settings(const std::string& path, Settings& out, std::string& err) {
  std::ifstream in(path);
  if (!in) {
    err = path;
    return ConfigStatus::NotFound;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_settings(ss.str(), out, err);
}

// ----- open_medium()
// OUT: a started medium in `out`, or nothing on failure.
bool open_medium(const MediumSettings& ms, std::unique_ptr<medium::IMedium>& out) {
  out.reset();
  if (ms.kind == "udp") {
    medium::UdpConfig cfg;
    cfg.channel = ms.channel;
    cfg.mtu = ms.mtu;
    cfg.bind_address = ms.bind_address;
    cfg.broadcast_address = ms.broadcast_address;
    auto udp = std::make_unique<medium::UdpMedium>();
    if (!udp->begin(cfg)) return false;
    out = std::move(udp);
    return true;
  }
  if (ms.kind == "serial") {
    medium::SerialConfig cfg;
    cfg.channel = ms.channel;
    cfg.mtu = ms.mtu;
    cfg.path = ms.device;
    cfg.baud = ms.baud;
    cfg.boot_delay_ms = ms.boot_delay_ms;
    auto serial = std::make_unique<medium::SerialMedium>();
    if (!serial->begin(cfg)) return false;
    out = std::move(serial);
    return true;
  }
  log::logger()->error("config: unknown medium kind '{}'", ms.kind);
  return false;
}

} // namespace viamesh
