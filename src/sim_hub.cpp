// -----------------------------------------------------------------------------
// sim_hub.cpp — simulated broadcast domain
// API & test hooks: see include/viamesh/medium/sim_hub.hpp
// -----------------------------------------------------------------------------
#include "viamesh/medium/sim_hub.hpp"
#include <algorithm>
#include <cstring>

namespace viamesh::medium {

// ---------- SimMedium ----------

TxResult SimMedium::broadcast(const uint8_t* data, std::size_t len) {
  if (!up_ || !data || !len) return TxResult::Error;
  if (len > mtu_) return TxResult::Error;
  hub_.carry(*this, data, len);
  return TxResult::Ok;
}

// -----------------------------------------------------------------------------
// wait()
// POLICY:
//   - A queued frame is returned at once; the clock does not move.
//   - Empty queue: give the idle hook a chance to produce traffic, then let
//     the whole timeout pass. Frames held back by lossy mode arrive "late",
//     i.e. become visible to the next wait().
// -----------------------------------------------------------------------------
RxResult SimMedium::wait(uint8_t* out, std::size_t cap, std::size_t& out_len, uint32_t timeout_ms) {
  out_len = 0;
  if (!up_) return RxResult::Error;

  if (queue_.empty()) hub_.run_idle_hook();
  if (queue_.empty()) {
    hub_.advance(timeout_ms);
    release_held();
    return RxResult::None;
  }

  std::vector<uint8_t> bytes = std::move(queue_.front());
  queue_.pop_front();
  if (bytes.size() > cap) return RxResult::None;   // radio would truncate; drop it
  std::memcpy(out, bytes.data(), bytes.size());
  out_len = bytes.size();
  return RxResult::Ok;
}

void SimMedium::tick_held() {
  for (auto it = held_.begin(); it != held_.end();) {
    if (--it->countdown <= 0) {
      queue_.push_back(std::move(it->bytes));
      it = held_.erase(it);
    } else {
      ++it;
    }
  }
}

void SimMedium::release_held() {
  for (Held& h : held_) queue_.push_back(std::move(h.bytes));
  held_.clear();
}

// ---------- SimHub ----------

SimMedium& SimHub::attach(const std::string& name) {
  radios_.push_back(std::make_unique<SimMedium>(*this, name));
  return *radios_.back();
}

void SimHub::link(const std::string& a, const std::string& b) {
  if (!find(a) || !find(b) || a == b) return;
  links_.insert(std::make_pair(std::min(a, b), std::max(a, b)));
}

void SimHub::unlink(const std::string& a, const std::string& b) {
  links_.erase(std::make_pair(std::min(a, b), std::max(a, b)));
}

void SimHub::link_all() {
  for (const auto& a : radios_) {
    for (const auto& b : radios_) link(a->host(), b->host());
  }
}

void SimHub::set_lossy(double drop_rate, double swap_rate, uint32_t seed) {
  drop_rate_ = drop_rate;
  swap_rate_ = swap_rate;
  rng_.seed(seed);
}

bool SimHub::inject(const std::string& to, const std::vector<uint8_t>& bytes) {
  SimMedium* r = find(to);
  if (!r) return false;
  r->enqueue(bytes);
  return true;
}

std::size_t SimHub::pending(const std::string& name) const {
  const SimMedium* r = find(name);
  return r ? r->pending() : 0;
}

SimMedium* SimHub::find(const std::string& name) const {
  for (const auto& r : radios_) {
    if (r->host() == name) return r.get();
  }
  return nullptr;
}

bool SimHub::linked(const std::string& a, const std::string& b) const {
  return links_.count(std::make_pair(std::min(a, b), std::max(a, b))) != 0;
}

// -----------------------------------------------------------------------------
// carry() — one broadcast reaches every linked, running radio.
// ORDER per receiver: filter → random drop → random hold-back → queue.
// Each frame that is queued normally moves held frames one step closer.
// -----------------------------------------------------------------------------
void SimHub::carry(const SimMedium& from, const uint8_t* data, std::size_t len) {
  const std::vector<uint8_t> bytes(data, data + len);
  std::uniform_real_distribution<double> roll(0.0, 1.0);
  std::uniform_int_distribution<int> delay(1, 3);

  ++frames_carried_;
  for (const auto& r : radios_) {
    if (r.get() == &from || !r->up_ || !linked(from.host(), r->host())) continue;
    if (filter_ && !filter_(from.host(), r->host(), bytes)) continue;
    if (drop_rate_ > 0.0 && roll(rng_) < drop_rate_) continue;
    if (swap_rate_ > 0.0 && roll(rng_) < swap_rate_) {
      r->hold(bytes, delay(rng_));
      continue;
    }
    r->enqueue(bytes);
    r->tick_held();
  }
}

bool SimHub::run_idle_hook() {
  if (!idle_hook_ || in_idle_hook_) return false;
  in_idle_hook_ = true;
  idle_hook_();
  in_idle_hook_ = false;
  return true;
}

} // namespace viamesh::medium
