/**
 * @file serial_io.hpp
 * @brief Raw-mode Linux TTY access and SLIP frame I/O for serial radio modems.
 *
 * @details
 * PURPOSE
 * -------
 * A serial-attached radio (LoRa board, packet modem, microcontroller bridge)
 * is the typical viamesh medium in the field. These free functions do the
 * POSIX part: open the TTY in raw 8N1 mode, write one SLIP frame, and read
 * one SLIP frame with a deadline. medium_serial.hpp wraps them as an IMedium.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Prefer /dev/serial/by-id/... paths; ttyACM numbers move between boots.
 * - The runtime user needs access to the device (dialout group or udev rule).
 * - USB CDC boards reset when the port opens; boot_delay_ms waits that out
 *   and the boot chatter is flushed afterwards.
 * - read_frame keeps partial frames in the caller's decoder, so a timeout in
 *   the middle of a frame loses nothing.
 *
 * @code
 *   int fd = viamesh::open_serial("/dev/ttyACM0", 115200, 400);
 *   if (fd < 0) { ... }
 *
 *   std::vector<uint8_t> stamp = ...;
 *   viamesh::write_frame(fd, stamp);
 *
 *   viamesh::slip::decoder dec(1200);
 *   std::vector<uint8_t> frame;
 *   if (viamesh::read_frame(fd, dec, frame, 1000)) { ... }
 *
 *   viamesh::close_serial(fd);
 * @endcode
 */
#pragma once
#include "slip.hpp"
#include <vector>
#include <string>
#include <cstdint>

namespace viamesh {

/**
 * @brief Open a TTY in raw mode and return its non-blocking descriptor.
 *
 * @param dev            device path, e.g. "/dev/ttyACM0"
 * @param baud           9600, 19200, 38400, 57600, 115200, 230400; others fall back to 115200
 * @param boot_delay_ms  sleep after open for USB auto-reset (200-500 ms typical)
 * @return descriptor >= 0, or -1 if the device cannot be opened or configured
 */
int open_serial(const std::string& dev, int baud = 115200, int boot_delay_ms = 400);

/**
 * @brief SLIP-encode @p payload and write it in one call.
 * @return false on a short or failed write
 */
bool write_frame(int fd, const std::vector<uint8_t>& payload);

/**
 * @brief Read until @p dec completes one frame or @p timeout_ms elapses.
 *
 * @param dec  decoder owned by the caller; keeps partial frames between calls
 * @param out  receives the payload on success
 * @return true on a complete frame; false on timeout or I/O error
 *         (check errno to tell them apart: 0 means timeout)
 */
bool read_frame(int fd, slip::decoder& dec, std::vector<uint8_t>& out, int timeout_ms);

/// Close a descriptor from open_serial(). Negative values are ignored.
void close_serial(int fd);

} // namespace viamesh
