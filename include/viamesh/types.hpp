/**
 * @file types.hpp
 * @brief Shared capacities and fixed-capacity string types for the viamesh transport.
 *
 * @details
 * Every protocol table and every wire field in viamesh lives in a fixed-capacity
 * ETL container. The numbers below are the whole memory budget of a transport:
 * change them here and every table follows.
 *
 * | Constant                 | Meaning                                              |
 * |--------------------------|------------------------------------------------------|
 * | `VM_HOST_MAX`            | longest hostname (fits a 36 char UUID)               |
 * | `VM_PAYLOAD_MAX`         | largest fragment payload carried by one frame        |
 * | `VM_FLAGS_MAX`           | longest flags token (`s1r1a1f65535`)                 |
 * | `VM_FRAME_OVERHEAD_MAX`  | worst case stamp bytes around the payload            |
 * | `VM_FRAME_MAX`           | largest encoded frame                                |
 *
 * Whole application messages are not bounded by these numbers; they are split
 * into `VM_PAYLOAD_MAX` (or smaller, see `Transport::mtu()`) fragments.
 */
#ifndef VIAMESH_TYPES_HPP
#define VIAMESH_TYPES_HPP

#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>

namespace viamesh {

static constexpr size_t VM_HOST_MAX    = 36;    ///< Max hostname length
static constexpr size_t VM_PAYLOAD_MAX = 1024;  ///< Max fragment payload per frame
static constexpr size_t VM_FLAGS_MAX   = 16;    ///< Max flags token length

/// id(8) + sequence(10) + flags + 2 hosts + port(5) + six '~' separators.
static constexpr size_t VM_FRAME_OVERHEAD_MAX =
    8 + 10 + VM_FLAGS_MAX + VM_HOST_MAX + VM_HOST_MAX + 5 + 6;

static constexpr size_t VM_FRAME_MAX = VM_PAYLOAD_MAX + VM_FRAME_OVERHEAD_MAX;

using HostStr    = etl::string<VM_HOST_MAX>;
using PayloadStr = etl::string<VM_PAYLOAD_MAX>;

/// Destination that every host consumes. Only valid for unreliable sends.
static constexpr const char* BROADCAST_HOST = "*";

/// Alias for the local host; never touches the medium.
static constexpr const char* LOOPBACK_HOST = "localhost";

/**
 * @brief Check that a hostname can travel in a frame.
 *
 * Valid hosts are 1..VM_HOST_MAX bytes and contain no '~' (the stamp separator).
 * The broadcast host "*" is valid here; callers decide where it is allowed.
 */
bool is_valid_host(const char* host);

} // namespace viamesh

#endif // VIAMESH_TYPES_HPP
