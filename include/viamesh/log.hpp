#pragma once
/**
 * @file log.hpp
 * @brief The "viamesh" spdlog logger shared by the library and tools.
 *
 * Levels used by the transport:
 *  - debug: per-frame trace (send, receive, forward, ack, retransmit)
 *  - info:  lifecycle (medium up/down)
 *  - warn:  losses, desync repair, table pressure
 *  - error: usage errors and medium failures
 */

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace viamesh::log {

/// The shared logger, created with a colour stderr sink on first use.
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level by name: trace, debug, info, warn, error, critical, off.
 * @return false if @p name is not a level; the level is left unchanged.
 */
bool set_level(const std::string& name);

} // namespace viamesh::log
