// -----------------------------------------------------------------------------
// log.cpp — shared spdlog logger
// -----------------------------------------------------------------------------
#include "viamesh/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace viamesh::log {

namespace {
static constexpr const char* LOGGER_NAME = "viamesh";
}

std::shared_ptr<spdlog::logger> logger() {
  auto existing = spdlog::get(LOGGER_NAME);
  if (existing) return existing;

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
  created->set_level(spdlog::level::info);
  created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  spdlog::register_logger(created);
  return created;
}

bool set_level(const std::string& name) {
  const spdlog::level::level_enum lvl = spdlog::level::from_str(name);
  // from_str maps unknown names to off; only accept "off" when asked for it
  if (lvl == spdlog::level::off && name != "off") return false;
  logger()->set_level(lvl);
  return true;
}

} // namespace viamesh::log
