/**
 * @file transport.hpp
 * @brief viamesh Transport — reliable and unreliable messaging over a broadcast mesh.
 *
 * @details
 * ## Field Brief
 * A set of hosts share one broadcast medium (radio, serial modem, UDP segment).
 * Not every host hears every other one. A host may sit on several media at
 * once (add_medium()); it then sends on all of them and listens to all of
 * them, which makes it a bridge between the two meshes. **Transport** gives each host two ways
 * to talk to any other host by name:
 *
 * - **unreliable**: best effort, unordered, may be lost or duplicated upstream;
 * - **reliable**: in order, exactly once, retransmitted until acknowledged or
 *   until the drop horizon gives up and the loss callback fires.
 *
 * Messages up to MAX_FRAGMENTS fragments long are split to fit the medium and
 * put back together on arrival. Frames for other hosts are flooded onward, so two
 * hosts out of each other's range still reach each other through the ones in
 * between.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  send(host,port,msg) ──► fragment ──► sequence ──► broadcast() on every medium
 *                                          │
 *                                          └─ reliable: SendTable record
 *
 *  receive(timeout) ──► housekeeping ──► queued message? ──► return it
 *        │                 ├─ retransmit overdue records (fresh id)
 *        │                 ├─ expire records, fire loss callback
 *        │                 └─ age out dedup + receive records
 *        │
 *        └──► wait(timeout) on all media ──► decode ──► dedup
 *                                          ├─ not for me: flood forward
 *                                          ├─ ack: SendTable
 *                                          └─ data: ReceiveTable ─► ack ─► reassemble
 * ```
 *
 * There is no background thread. Nothing is retransmitted, aged or forwarded
 * unless the application calls `receive()` (or `poll()`). Call it in a loop
 * with a short timeout.
 *
 * ---
 *
 * @par Failure Model
 * - **Usage errors** (reliable broadcast, bad destination, own hostname not
 *   valid, more than MAX_FRAGMENTS fragments): `send` returns a status,
 *   nothing is transmitted.
 * - **Tables full**: `send` returns `SendStatus::TableFull` before any fragment
 *   goes out; inbound frames that do not fit are dropped without an ack,
 *   except that a frame which unblocks a stream displaces a record buffered
 *   early (its sender retransmits it later).
 * - **Transient loss**: retransmission every `retransmit_ms`.
 * - **Permanent loss**: after `drop_ms` the record is dropped and the loss
 *   callback receives the handle, port and last fragment payload.
 * - **Receiver restarted**: an ack naming nothing we sent forces SYN on the
 *   oldest pending record, which restarts the receiver's stream.
 * - **Duplicates / echoes / malformed frames**: dropped silently.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * viamesh::medium::UdpMedium udp;
 * viamesh::medium::UdpConfig ucfg;
 * udp.begin(ucfg);
 *
 * viamesh::SteadyClock clock;
 * viamesh::TransportConfig cfg;
 * cfg.hostname = "BASE";
 * viamesh::Transport mesh(cfg, udp, clock);
 *
 * mesh.send("NODE7", 10, "hello", true);
 *
 * viamesh::Delivery d;
 * while (running) {
 *   if (mesh.receive(100, d)) handle(d.host, d.port, d.message);
 * }
 * @endcode
 */
#ifndef VIAMESH_TRANSPORT_HPP
#define VIAMESH_TRANSPORT_HPP

#include "viamesh/types.hpp"
#include "viamesh/clock.hpp"
#include "viamesh/frame.hpp"
#include "viamesh/dedup_cache.hpp"
#include "viamesh/send_table.hpp"
#include "viamesh/receive_table.hpp"
#include "viamesh/stream_key.hpp"
#include "viamesh/medium/medium_base.hpp"
#include "etl/deque.h"
#include "etl/vector.h"
#include <stdint.h>
#include <functional>
#include <random>
#include <string>

namespace viamesh {

/**
 * @brief Protocol constants for one transport.
 *
 * Defaults match a slow shared radio channel. All hosts of one mesh must agree
 * on `max_sequence`; the other values are local.
 */
struct TransportConfig {
  HostStr  hostname;                     ///< This host's name. Required.
  uint16_t mtu{VM_PAYLOAD_MAX};          ///< Max payload bytes per fragment (clamped, see Transport::mtu())
  uint32_t retransmit_ms{3000};          ///< Resend a pending record after this long without an ack
  uint32_t drop_ms{12000};               ///< Forget records (and give up on sends) after this long
  uint32_t max_sequence{0xFFFFFFFFu};    ///< Sequences run 1..max_sequence then wrap
  bool     forward{true};                ///< Flood frames addressed to other hosts
  uint32_t rng_seed{0};                  ///< Packet id / start sequence seed. 0 = random_device.
};

/// Names one reliable send: the destination and the sequence of its last fragment.
struct Handle {
  HostStr  host;
  uint32_t sequence{0};

  bool valid() const { return sequence != 0; }
  bool operator==(const Handle& o) const { return sequence == o.sequence && host == o.host; }
};

enum class SendStatus : uint8_t {
  Ok = 0,
  BroadcastReliable,  ///< reliable send to "*"
  BadHost,            ///< empty, oversized, or contains '~' (destination or own hostname)
  MessageTooLarge,    ///< more than Transport::MAX_FRAGMENTS fragments
  TableFull,          ///< send or peer table cannot take the message
  MediumError,        ///< unreliable send: medium refused a fragment
  TimedOut            ///< waiting send: record dropped before an ack arrived
};

const char* to_string(SendStatus s);

struct SendResult {
  SendStatus status{SendStatus::Ok};
  Handle     handle;                     ///< valid for reliable sends only

  bool ok() const { return status == SendStatus::Ok; }
};

/// One complete message handed to the application.
struct Delivery {
  HostStr     host;                      ///< source host
  uint16_t    port{0};
  std::string message;
};

enum class AckState : uint8_t {
  Unknown = 0,   ///< no record: never sent, or already expired
  Pending,       ///< sent, waiting for an ack
  Acknowledged   ///< acked, record kept until the drop horizon
};

/// Loss callback: (handle, port, payload of the expired fragment).
using LossCallback = std::function<void(const Handle&, uint16_t, const std::string&)>;

struct TransportStats {
  uint32_t frames_sent{0};
  uint32_t frames_received{0};
  uint32_t frames_forwarded{0};
  uint32_t frames_malformed{0};
  uint32_t duplicates_dropped{0};
  uint32_t retransmissions{0};
  uint32_t timeouts{0};
  uint32_t desyncs_repaired{0};
  uint32_t messages_delivered{0};
};

class Transport {
public:
  static constexpr size_t READY_CAP = 2 * ReceiveTable::CAPACITY;  ///< Accepted records awaiting reassembly
  static constexpr size_t INBOX_CAP = 64;                          ///< Loopback messages waiting
  static constexpr size_t MEDIA_CAP = 4;                           ///< Media one transport can join
  static constexpr uint32_t MUX_SLICE_MS = 20;                     ///< Per-medium wait slice with several media

  /// Longest chain a receiver can hold and reassemble. Largest message: MAX_FRAGMENTS * mtu().
  static constexpr size_t MAX_FRAGMENTS = ReceiveTable::CAPACITY;

  /**
   * @brief Bind a transport to a medium and a clock.
   *
   * Both are borrowed and must outlive the transport. The medium must already
   * be started with begin().
   */
  Transport(const TransportConfig& cfg, medium::IMedium& medium, const IClock& clock);

  /**
   * @brief Join one more medium (borrowed, already started).
   *
   * Frames are then sent and forwarded on every medium and received from any
   * of them. mtu() becomes the smallest of all media.
   * @return false if @p m is already joined or MEDIA_CAP media are in use
   */
  bool add_medium(medium::IMedium& m);

  size_t media_count() const { return media_.size(); }

  Transport(const Transport&) = delete;
  Transport& operator=(const Transport&) = delete;

  /**
   * @brief Send @p message to @p host on application @p port.
   *
   * @param host        destination name, "*" for broadcast (unreliable only),
   *                    "localhost" or own hostname for loopback
   * @param reliable    request in-order, exactly-once delivery
   * @param wait_for_ack block until acked (Ok) or dropped (TimedOut), pumping
   *                    this transport meanwhile; messages that arrive during the
   *                    wait stay queued for later receive() calls
   */
  SendResult send(const char* host, uint16_t port, const std::string& message,
                  bool reliable, bool wait_for_ack = false);

  /**
   * @brief Run the protocol and return the next complete message, if any.
   *
   * Performs housekeeping, then returns a queued message if one is
   * waiting; otherwise waits up to @p timeout_ms for one frame and processes it.
   * Returns false when that frame did not complete a message (ack, forward,
   * out-of-order fragment, duplicate, timeout).
   *
   * @param on_lost loss callback for this call; empty uses the handler set by
   *                set_connection_lost_handler()
   */
  bool receive(uint32_t timeout_ms, Delivery& out, const LossCallback& on_lost = LossCallback());

  /**
   * @brief Service the protocol without consuming messages.
   *
   * Same pump as receive(): housekeeping plus at most one inbound frame.
   * Messages completed here stay queued for the next receive(). Relays and
   * waiting senders use this.
   */
  void poll(uint32_t timeout_ms);

  void set_connection_lost_handler(const LossCallback& cb) { on_lost_ = cb; }

  AckState ack_state(const Handle& h) const;

  const HostStr&         hostname() const { return cfg_.hostname; }
  const TransportConfig& config() const { return cfg_; }
  const TransportStats&  stats() const { return stats_; }

  /// Effective fragment size: min(config mtu, medium mtu minus stamp overhead, VM_PAYLOAD_MAX).
  size_t mtu() const;

private:
  bool is_self(const char* host) const;
  SendResult send_loopback(uint16_t port, const std::string& message, bool reliable);
  SendResult await_ack(const Handle& h);

  // ----- protocol pump -----
  void housekeeping(uint64_t now_ms, const LossCallback& on_lost);
  void pump(uint32_t timeout_ms);
  bool wait_any(size_t& len, uint32_t timeout_ms);
  bool poll_medium(size_t idx, size_t& len, uint32_t timeout_ms);
  bool next_ready(Delivery& out);
  void push_ready(const RecordKey& key);

  // ----- inbound -----
  void handle_frame(const uint8_t* data, size_t len, uint64_t now_ms);
  void handle_ack(const Frame& f);
  void handle_data(const Frame& f, uint64_t now_ms);
  void drain(const StreamKey& stream, uint32_t from_seq);
  void forward(const Frame& f, const uint8_t* data, size_t len);

  // ----- outbound -----
  bool transmit(const Frame& f, uint64_t now_ms);
  bool broadcast_all(const uint8_t* data, size_t len, uint32_t id);
  void send_ack(const HostStr& to, uint16_t port, uint32_t seq, uint64_t now_ms);
  uint32_t new_packet_id();
  uint32_t random_sequence();

  TransportConfig cfg_;
  etl::vector<medium::IMedium*, MEDIA_CAP> media_;
  const IClock&   clock_;
  bool            host_ok_;
  size_t          rx_next_{0};               // medium served first by the next wait

  DedupCache   dedup_;
  SendTable    sent_;
  ReceiveTable received_;

  etl::deque<RecordKey, READY_CAP> ready_;   // accepted records, delivery order
  etl::deque<Delivery, INBOX_CAP>  inbox_;   // loopback messages

  SendTable::ExpiredList expired_;            // scratch for housekeeping
  uint8_t                rx_buf_[VM_FRAME_MAX];

  LossCallback   on_lost_;
  std::mt19937   rng_;
  TransportStats stats_;
  uint32_t       loopback_seq_{0};
};

} // namespace viamesh

#endif // VIAMESH_TRANSPORT_HPP
