/**
 * @file sim_hub.hpp
 * @brief In-process broadcast domain with a manual clock, for tests and demos.
 *
 * @details
 * SimHub stands in for the air. Each attached SimMedium is one radio; links
 * say which radios hear each other (a line A-B-C means A and C need B to relay).
 * Frames are queued per receiver and handed out by SimMedium::wait().
 *
 * Time is simulated: the hub is the IClock for every transport on it, and the
 * clock only moves when a wait() finds its queue empty (it advances by the
 * timeout) or when a test calls advance(). Runs are fully deterministic.
 *
 * Test hooks:
 *  - set_filter(fn): called for every (from, to, frame) before delivery;
 *    return false to drop it. Lets a test lose one specific frame.
 *  - set_lossy(drop, swap, seed): random loss and reordering (a swapped frame
 *    is held back behind up to three later ones).
 *  - set_idle_hook(fn): runs when a wait() finds its queue empty, before the
 *    clock moves. Lets a test drive a second transport while the first one is
 *    blocked in a waiting send. Not re-entered.
 *  - inject(to, bytes): hand a frame straight to one radio.
 *
 * @code
 * viamesh::medium::SimHub hub;
 * auto& a = hub.attach("A");
 * auto& b = hub.attach("B");
 * hub.link("A", "B");
 * viamesh::Transport ta(cfg_a, a, hub), tb(cfg_b, b, hub);
 * @endcode
 */
#ifndef VIAMESH_MEDIUM_SIM_HUB_HPP
#define VIAMESH_MEDIUM_SIM_HUB_HPP

#include "viamesh/medium/medium_base.hpp"
#include "viamesh/clock.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace viamesh::medium {

class SimHub;

class SimMedium : public IMedium {
public:
  SimMedium(SimHub& hub, const std::string& name) : hub_(hub), name_(name) {}

  bool        begin(const Config& cfg) override { mtu_ = cfg.mtu; up_ = true; return true; }
  void        end() override { up_ = false; queue_.clear(); }
  TxResult    broadcast(const uint8_t* data, std::size_t len) override;
  RxResult    wait(uint8_t* out, std::size_t cap, std::size_t& out_len, uint32_t timeout_ms) override;
  const char* name() const override { return name_.c_str(); }
  std::size_t mtu() const override { return mtu_; }

  const std::string& host() const { return name_; }
  std::size_t pending() const { return queue_.size(); }

private:
  friend class SimHub;

  struct Held {
    std::vector<uint8_t> bytes;
    int countdown;
  };

  void enqueue(const std::vector<uint8_t>& bytes) { queue_.push_back(bytes); }
  void hold(const std::vector<uint8_t>& bytes, int countdown) { held_.push_back(Held{bytes, countdown}); }
  void tick_held();
  void release_held();

  SimHub& hub_;
  std::string name_;
  std::size_t mtu_{1400};
  bool up_{true};
  std::deque<std::vector<uint8_t>> queue_;
  std::vector<Held> held_;
};

class SimHub : public IClock {
public:
  using Filter = std::function<bool(const std::string& from, const std::string& to,
                                    const std::vector<uint8_t>& frame)>;

  explicit SimHub(uint64_t start_ms = 1000) : now_ms_(start_ms) {}

  SimHub(const SimHub&) = delete;
  SimHub& operator=(const SimHub&) = delete;

  uint64_t now_ms() const override { return now_ms_; }
  void advance(uint64_t ms) { now_ms_ += ms; }

  /// Add a radio. The reference stays valid for the hub's lifetime.
  SimMedium& attach(const std::string& name);

  /// Let @p a and @p b hear each other. Unknown names are ignored.
  void link(const std::string& a, const std::string& b);
  void unlink(const std::string& a, const std::string& b);

  /// Link every pair of attached radios.
  void link_all();

  void set_filter(Filter f) { filter_ = std::move(f); }
  void set_lossy(double drop_rate, double swap_rate, uint32_t seed);
  void clear_lossy() { drop_rate_ = 0.0; swap_rate_ = 0.0; }
  void set_idle_hook(std::function<void()> hook) { idle_hook_ = std::move(hook); }

  /// Queue @p bytes at radio @p to as if a neighbour had sent them.
  bool inject(const std::string& to, const std::vector<uint8_t>& bytes);

  std::size_t pending(const std::string& name) const;
  uint64_t frames_carried() const { return frames_carried_; }

private:
  friend class SimMedium;

  SimMedium* find(const std::string& name) const;
  bool linked(const std::string& a, const std::string& b) const;
  void carry(const SimMedium& from, const uint8_t* data, std::size_t len);
  bool run_idle_hook();

  uint64_t now_ms_;
  std::vector<std::unique_ptr<SimMedium>> radios_;
  std::set<std::pair<std::string, std::string>> links_;
  Filter filter_;
  std::function<void()> idle_hook_;
  bool in_idle_hook_{false};

  double drop_rate_{0.0};
  double swap_rate_{0.0};
  std::mt19937 rng_{1};
  uint64_t frames_carried_{0};
};

} // namespace viamesh::medium

#endif // VIAMESH_MEDIUM_SIM_HUB_HPP
