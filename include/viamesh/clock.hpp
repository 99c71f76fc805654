#pragma once
/**
 * @file clock.hpp
 * @brief Millisecond time source for the transport.
 *
 * Production code uses SteadyClock. Tests hand the transport a SimHub, whose
 * clock only moves when the simulation says so.
 */

#include <chrono>
#include <stdint.h>

namespace viamesh {

class IClock {
public:
  virtual ~IClock() = default;
  virtual uint64_t now_ms() const = 0;
};

class SteadyClock : public IClock {
public:
  uint64_t now_ms() const override {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
  }
};

} // namespace viamesh
