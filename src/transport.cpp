// -----------------------------------------------------------------------------
// transport.cpp — Implementation of the viamesh Transport
//
// API & failure model:
//   see include/viamesh/transport.hpp
//
// Runnable scenarios (loss, reordering, wraparound, flooding):
//   see tests/test_transport_*.cpp
//
// NOTE: this file holds the protocol policy: when to ack, when to deliver,
// when to retransmit. Storage and bookkeeping live in the tables.
// -----------------------------------------------------------------------------
#include "viamesh/transport.hpp"
#include "viamesh/log.hpp"
#include "viamesh/sequence.hpp"
#include <algorithm>
#include <string.h>

namespace viamesh {

const char* to_string(SendStatus s) {
  switch (s) {
    case SendStatus::Ok:                return "ok";
    case SendStatus::BroadcastReliable: return "broadcast_reliable";
    case SendStatus::BadHost:           return "bad_host";
    case SendStatus::MessageTooLarge:   return "message_too_large";
    case SendStatus::TableFull:         return "table_full";
    case SendStatus::MediumError:       return "medium_error";
    case SendStatus::TimedOut:          return "timed_out";
  }
  return "unknown";
}

// ---------- public ----------

Transport::Transport(const TransportConfig& cfg, medium::IMedium& medium, const IClock& clock)
: cfg_(cfg), clock_(clock),
  host_ok_(is_valid_host(cfg.hostname.c_str()) && strcmp(cfg.hostname.c_str(), BROADCAST_HOST) != 0),
  rng_(cfg.rng_seed != 0 ? cfg.rng_seed : std::random_device{}()) {
  media_.push_back(&medium);
  if (cfg_.max_sequence < 2) {
    log::logger()->warn("max_sequence {} too small, using 2", cfg_.max_sequence);
    cfg_.max_sequence = 2;
  }
  if (!host_ok_) {
    log::logger()->error("transport hostname '{}' is not a valid host; send() will refuse",
                         cfg_.hostname.c_str());
  }
}

bool Transport::add_medium(medium::IMedium& m) {
  if (std::find(media_.begin(), media_.end(), &m) != media_.end()) return false;
  if (media_.full()) {
    log::logger()->error("cannot join {}: already on {} media", m.name(), media_.size());
    return false;
  }
  media_.push_back(&m);
  log::logger()->info("joined medium {} ({} total)", m.name(), media_.size());
  return true;
}

size_t Transport::mtu() const {
  size_t link = media_.front()->mtu();
  for (const medium::IMedium* m : media_) link = std::min(link, m->mtu());
  const size_t room = link > VM_FRAME_OVERHEAD_MAX ? link - VM_FRAME_OVERHEAD_MAX : 1;
  size_t m = cfg_.mtu > 0 ? cfg_.mtu : 1;
  m = std::min(m, room);
  m = std::min(m, VM_PAYLOAD_MAX);
  return m;
}

// -----------------------------------------------------------------------------
// send()
// PRE:   none; every argument is validated here.
// POLICY:
//   - Usage errors and table exhaustion are reported before anything is
//     transmitted, so a failed send leaves no partial message on the air.
//   - One sequence per fragment; the handle names the last fragment, whose
//     ack (being cumulative) covers the whole message.
//   - Reliable fragments are recorded even if the medium refused them; the
//     retransmission pass tries again.
// OUT:   SendResult with a handle for reliable sends.
// -----------------------------------------------------------------------------
SendResult Transport::send(const char* host, uint16_t port, const std::string& message,
                           bool reliable, bool wait_for_ack) {
  SendResult result;

  if (!host_ok_) {
    log::logger()->error("send: own hostname '{}' is not a valid host", cfg_.hostname.c_str());
    result.status = SendStatus::BadHost;
    return result;
  }
  if (!is_valid_host(host)) {
    log::logger()->error("send: invalid host '{}'", host ? host : "(null)");
    result.status = SendStatus::BadHost;
    return result;
  }
  if (reliable && strcmp(host, BROADCAST_HOST) == 0) {
    log::logger()->error("send: reliable delivery to broadcast host is not supported");
    result.status = SendStatus::BroadcastReliable;
    return result;
  }
  if (is_self(host)) return send_loopback(port, message, reliable);

  const size_t frag = mtu();
  const size_t count = message.empty() ? 1 : (message.size() + frag - 1) / frag;
  if (count > MAX_FRAGMENTS) {
    log::logger()->error("send: message of {} bytes needs {} fragments, limit is {}",
                         message.size(), count, MAX_FRAGMENTS);
    result.status = SendStatus::MessageTooLarge;
    return result;
  }

  StreamKey stream;
  stream.host = host;
  stream.reliable = reliable;

  if (sent_.peer_table_full(stream)) {
    log::logger()->warn("send: peer table full, refusing new stream to {}", host);
    result.status = SendStatus::TableFull;
    return result;
  }
  if (reliable && !sent_.reserve(count)) {
    log::logger()->warn("send: {} fragments to {} do not fit the send table ({} pending)",
                        count, host, sent_.pending_count());
    result.status = SendStatus::TableFull;
    return result;
  }

  const uint64_t now = clock_.now_ms();
  bool medium_ok = true;

  Frame f;
  f.destination = host;
  f.source = cfg_.hostname;
  f.port = port;

  for (size_t i = 0; i < count; ++i) {
    uint32_t seq = 0;
    bool syn = false;
    if (!sent_.next_sequence(stream, cfg_.max_sequence, random_sequence(), seq, syn)) {
      result.status = SendStatus::TableFull;      // checked above; only a bug lands here
      return result;
    }

    f.id = new_packet_id();
    f.sequence = seq;
    f.flags = PacketFlags();
    f.flags.syn = syn;
    f.flags.requires_ack = reliable;
    if (count > 1) {
      if (i + 1 < count) f.flags.more_fragments = true;
      else               f.flags.fragment_count = static_cast<uint16_t>(count);
    }

    const size_t offset = i * frag;
    const size_t n = std::min(frag, message.size() - offset);
    f.payload.assign(message.data() + offset, n);

    if (!transmit(f, now)) medium_ok = false;

    if (reliable) {
      SendRecord rec;
      rec.first_sent_ms = now;
      rec.last_tx_ms = now;
      rec.packet_id = f.id;
      rec.flags = f.flags;
      rec.port = port;
      rec.payload = f.payload;
      rec.pending = true;
      if (!sent_.store(f.destination, seq, rec)) {
        log::logger()->error("send: lost send record {}:{} after reserve", host, seq);
      }
      result.handle.host = f.destination;
      result.handle.sequence = seq;
    }
  }

  if (!reliable) {
    if (!medium_ok) result.status = SendStatus::MediumError;
    return result;
  }

  log::logger()->debug("send: {} bytes to {}:{} in {} fragment(s), handle seq={}",
                       message.size(), host, port, count, result.handle.sequence);

  if (!wait_for_ack) return result;
  return await_ack(result.handle);
}

bool Transport::receive(uint32_t timeout_ms, Delivery& out, const LossCallback& on_lost) {
  housekeeping(clock_.now_ms(), on_lost ? on_lost : on_lost_);
  if (next_ready(out)) return true;
  pump(timeout_ms);
  return next_ready(out);
}

void Transport::poll(uint32_t timeout_ms) {
  housekeeping(clock_.now_ms(), on_lost_);
  pump(timeout_ms);
}

AckState Transport::ack_state(const Handle& h) const {
  if (!h.valid()) return AckState::Unknown;
  if (h.host == cfg_.hostname) return AckState::Acknowledged;   // loopback
  const SendRecord* rec = sent_.find(h.host, h.sequence);
  if (!rec) return AckState::Unknown;
  return rec->pending ? AckState::Pending : AckState::Acknowledged;
}

// ---------- private: send helpers ----------

bool Transport::is_self(const char* host) const {
  return strcmp(host, LOOPBACK_HOST) == 0 || cfg_.hostname == host;
}

// send_loopback() — whole message straight to our own inbox; no fragments, no medium.
SendResult Transport::send_loopback(uint16_t port, const std::string& message, bool reliable) {
  SendResult result;
  if (inbox_.full()) {
    log::logger()->warn("send: loopback inbox full, dropping {} bytes", message.size());
    result.status = SendStatus::TableFull;
    return result;
  }

  Delivery d;
  d.host = cfg_.hostname;
  d.port = port;
  d.message = message;
  inbox_.push_back(d);

  if (reliable) {
    loopback_seq_ = seq::next(loopback_seq_, cfg_.max_sequence);
    result.handle.host = cfg_.hostname;
    result.handle.sequence = loopback_seq_;
  }
  return result;
}

// -----------------------------------------------------------------------------
// await_ack() — block the caller, not the protocol.
// POLICY:
//   - Pump in slices of one retransmit interval so retransmissions and the
//     drop horizon keep running while we wait.
//   - Acknowledged → Ok; record gone (dropped at horizon) → TimedOut.
//   - Messages completed meanwhile stay in the ready queue.
// -----------------------------------------------------------------------------
SendResult Transport::await_ack(const Handle& h) {
  SendResult result;
  result.handle = h;
  for (;;) {
    const AckState st = ack_state(h);
    if (st == AckState::Acknowledged) return result;
    if (st == AckState::Unknown) {
      result.status = SendStatus::TimedOut;
      return result;
    }
    poll(cfg_.retransmit_ms);
  }
}

bool Transport::transmit(const Frame& f, uint64_t now_ms) {
  FrameBytes bytes;
  if (!encode_frame(f, bytes)) {
    log::logger()->error("tx: cannot encode frame to '{}'", f.destination.c_str());
    return false;
  }

  dedup_.record(f.id, now_ms);                 // never process our own echo

  if (!broadcast_all(bytes.data(), bytes.size(), f.id)) return false;

  ++stats_.frames_sent;
  log::logger()->debug("tx {:08X} seq={} flags={} {} -> {}:{} len={}",
                       f.id, f.sequence, f.flags.to_token().c_str(), f.source.c_str(),
                       f.destination.c_str(), f.port, f.payload.size());
  return true;
}

void Transport::send_ack(const HostStr& to, uint16_t port, uint32_t seq, uint64_t now_ms) {
  Frame f;
  f.id = new_packet_id();
  f.sequence = seq;
  f.flags.ack = true;
  f.destination = to;
  f.source = cfg_.hostname;
  f.port = port;
  if (!transmit(f, now_ms)) {
    log::logger()->warn("ack {} to {} not sent; sender will retransmit", seq, to.c_str());
  }
}

// broadcast_all() — true if at least one medium took the frame.
bool Transport::broadcast_all(const uint8_t* data, size_t len, uint32_t id) {
  bool any = false;
  for (medium::IMedium* m : media_) {
    const medium::TxResult r = m->broadcast(data, len);
    if (r == medium::TxResult::Ok) {
      any = true;
    } else {
      log::logger()->error("tx: {} refused frame {:08X}: {}", m->name(), id, medium::to_string(r));
    }
  }
  return any;
}

uint32_t Transport::new_packet_id() {
  return static_cast<uint32_t>(rng_());
}

uint32_t Transport::random_sequence() {
  std::uniform_int_distribution<uint32_t> dist(1, cfg_.max_sequence);
  return dist(rng_);
}

// ---------- private: protocol pump ----------

// -----------------------------------------------------------------------------
// housekeeping() — everything that only happens because time passed.
// ORDER:
//   1. expire send records (collect losses, report last)
//   2. retransmit overdue pending records with a fresh packet id
//   3. age out the dedup cache and the receive table
//   4. fire the loss callback for each expired pending send
// NOTE: callbacks run last so they may call send() or receive() safely.
// -----------------------------------------------------------------------------
void Transport::housekeeping(uint64_t now_ms, const LossCallback& on_lost) {
  sent_.expire(now_ms, cfg_.drop_ms, expired_);

  sent_.for_each_due(now_ms, cfg_.retransmit_ms,
                     [&](const HostStr& host, uint32_t seq, SendRecord& rec) {
    Frame f;
    f.id = new_packet_id();
    f.sequence = seq;
    f.flags = rec.flags;
    f.destination = host;
    f.source = cfg_.hostname;
    f.port = rec.port;
    f.payload = rec.payload;

    rec.packet_id = f.id;
    rec.last_tx_ms = now_ms;                   // a refused frame waits a full interval too
    if (transmit(f, now_ms)) {
      ++stats_.retransmissions;
      log::logger()->debug("retransmit {}:{} as {:08X}", host.c_str(), seq, f.id);
    }
  });

  dedup_.evict(now_ms, cfg_.drop_ms);
  received_.evict(now_ms, cfg_.drop_ms);

  while (!expired_.empty()) {
    const ExpiredSend lost = expired_.front();
    expired_.pop_front();
    ++stats_.timeouts;
    log::logger()->warn("send to {} seq={} port={} timed out", lost.host.c_str(), lost.sequence, lost.port);
    if (on_lost) {
      Handle h;
      h.host = lost.host;
      h.sequence = lost.sequence;
      on_lost(h, lost.port, std::string(lost.payload.data(), lost.payload.size()));
    }
  }
}

void Transport::pump(uint32_t timeout_ms) {
  size_t len = 0;
  if (!wait_any(len, timeout_ms)) return;
  handle_frame(rx_buf_, len, clock_.now_ms());
}

bool Transport::poll_medium(size_t idx, size_t& len, uint32_t timeout_ms) {
  medium::IMedium* m = media_[idx];
  len = 0;
  const medium::RxResult r = m->wait(rx_buf_, sizeof(rx_buf_), len, timeout_ms);
  if (r == medium::RxResult::Error) {
    log::logger()->error("rx: {} reported a link error", m->name());
    return false;
  }
  return r == medium::RxResult::Ok && len > 0;
}

// -----------------------------------------------------------------------------
// wait_any() — one frame from whichever medium has one, within timeout_ms.
// POLICY:
//   - One medium: a plain blocking wait.
//   - Several: a non-blocking sweep, then short waits on each in turn until
//     the deadline. The sweep starts after the medium served last, so a busy
//     link cannot starve a quiet one.
//   - Turns are capped so a link that fails instantly cannot spin forever.
// -----------------------------------------------------------------------------
bool Transport::wait_any(size_t& len, uint32_t timeout_ms) {
  const size_t n = media_.size();
  if (n == 1) return poll_medium(0, len, timeout_ms);

  for (size_t i = 0; i < n; ++i) {
    const size_t idx = (rx_next_ + i) % n;
    if (poll_medium(idx, len, 0)) {
      rx_next_ = (idx + 1) % n;
      return true;
    }
  }

  const uint64_t deadline = clock_.now_ms() + timeout_ms;
  const size_t max_turns = n * (timeout_ms / MUX_SLICE_MS + 1);
  for (size_t turn = 0; turn < max_turns; ++turn) {
    const uint64_t now = clock_.now_ms();
    if (now >= deadline) break;
    const size_t idx = rx_next_;
    rx_next_ = (rx_next_ + 1) % n;
    const uint32_t slice = static_cast<uint32_t>(std::min<uint64_t>(deadline - now, MUX_SLICE_MS));
    if (poll_medium(idx, len, slice)) return true;
  }
  return false;
}

// next_ready() — loopback first, then accepted records in arrival order.
bool Transport::next_ready(Delivery& out) {
  if (!inbox_.empty()) {
    out = inbox_.front();
    inbox_.pop_front();
    ++stats_.messages_delivered;
    return true;
  }
  while (!ready_.empty()) {
    const RecordKey key = ready_.front();
    ready_.pop_front();
    if (received_.take_message(key, cfg_.max_sequence, out.port, out.message)) {
      out.host = key.host;
      ++stats_.messages_delivered;
      return true;
    }
  }
  return false;
}

void Transport::push_ready(const RecordKey& key) {
  for (const RecordKey& k : ready_) {
    if (k == key) return;
  }
  if (ready_.full()) {
    log::logger()->warn("ready queue full, dropping {}:{}", key.host.c_str(), key.sequence);
    return;
  }
  ready_.push_back(key);
}

// ---------- private: inbound ----------

// -----------------------------------------------------------------------------
// handle_frame()
// POLICY:
//   - Unparseable → drop. Seen id → drop (covers echoes and flood loops).
//   - Not addressed to us (including "*") → flood forward unchanged.
//   - Addressed to us or "*" → ack handling or data handling.
// -----------------------------------------------------------------------------
void Transport::handle_frame(const uint8_t* data, size_t len, uint64_t now_ms) {
  Frame f;
  const FrameStatus st = decode_frame(data, len, f);
  if (st != FrameStatus::Ok) {
    ++stats_.frames_malformed;
    log::logger()->debug("rx: dropped {} byte frame ({})", len, to_string(st));
    return;
  }
  if (dedup_.seen(f.id)) {
    ++stats_.duplicates_dropped;
    return;
  }
  dedup_.record(f.id, now_ms);
  ++stats_.frames_received;

  log::logger()->debug("rx {:08X} seq={} flags={} {} -> {}:{} len={}",
                       f.id, f.sequence, f.flags.to_token().c_str(), f.source.c_str(),
                       f.destination.c_str(), f.port, f.payload.size());

  if (f.destination != cfg_.hostname) forward(f, data, len);

  const bool broadcast = f.destination == BROADCAST_HOST;
  if (f.destination != cfg_.hostname && !broadcast) return;

  if (f.flags.ack) {
    if (!broadcast) handle_ack(f);
    return;
  }
  handle_data(f, now_ms);
}

void Transport::forward(const Frame& f, const uint8_t* data, size_t len) {
  if (!cfg_.forward) return;
  if (!broadcast_all(data, len, f.id)) {
    log::logger()->warn("forward {:08X} failed on every medium", f.id);
    return;
  }
  ++stats_.frames_forwarded;
  log::logger()->debug("forward {:08X} {} -> {}", f.id, f.source.c_str(), f.destination.c_str());
}

void Transport::handle_ack(const Frame& f) {
  if (sent_.find(f.source, f.sequence)) {
    const size_t n = sent_.acknowledge(f.source, f.sequence, cfg_.max_sequence);
    if (n > 0) {
      log::logger()->debug("ack {}:{} cleared {} record(s)", f.source.c_str(), f.sequence, n);
    }
    return;
  }

  if (sent_.force_syn(f.source, f.sequence, cfg_.max_sequence)) {
    ++stats_.desyncs_repaired;
    log::logger()->warn("unexpected ack {} from {}, restarting stream with SYN",
                        f.sequence, f.source.c_str());
  }
}

// -----------------------------------------------------------------------------
// handle_data()
// PRE:   frame is addressed to us or "*", not an ack, not a duplicate id.
// POLICY:
//   - A record already consumed is not processed again (still acked),
//     unless it is the expected successor after a wrap of the sequence space.
//   - Unreliable: straight to the ready queue.
//   - Reliable: SYN or the expected successor is accepted and drains any
//     buffered successors; anything else waits in the table.
//   - Table full: a frame that unblocks its stream (SYN or the expected
//     successor) displaces an early record; anything else is dropped.
//   - Every reliable frame is answered with the last in-order sequence
//     (0 if none), unless the frame could not be stored at all.
// -----------------------------------------------------------------------------
void Transport::handle_data(const Frame& f, uint64_t now_ms) {
  if (f.sequence == 0) {
    ++stats_.frames_malformed;                 // data never uses sequence 0
    return;
  }

  const bool reliable = f.flags.reliable();

  RecordKey key;
  key.host = f.source;
  key.reliable = reliable;
  key.sequence = f.sequence;
  const StreamKey stream = key.stream();

  uint32_t last = 0;
  const bool has_last = reliable && received_.last_delivered(stream, last);
  const bool in_order = has_last && seq::next(last, cfg_.max_sequence) == f.sequence;

  // A consumed record that is also the expected successor is a leftover from
  // the previous lap of the sequence space, not a retransmission.
  const ReceiveRecord* existing = received_.find(key);
  if (existing && existing->consumed && !in_order) {
    log::logger()->debug("rx: {}:{} already delivered", f.source.c_str(), f.sequence);
  } else {
    ReceiveRecord rec;
    rec.arrived_ms = now_ms;
    rec.flags = f.flags;
    rec.port = f.port;
    rec.payload = f.payload;
    rec.accepted = !reliable;
    rec.consumed = false;
    const bool unblocks = reliable && (f.flags.syn || in_order);
    bool stored = received_.store(key, rec);
    if (!stored && unblocks && received_.displace_early(key, cfg_.max_sequence)) {
      log::logger()->debug("rx: {}:{} displaced an early record", f.source.c_str(), f.sequence);
      stored = received_.store(key, rec);
    }
    if (!stored) {
      log::logger()->warn("receive table full, dropping {}:{}", f.source.c_str(), f.sequence);
      return;
    }

    if (!reliable) {
      push_ready(key);
    } else {
      if (unblocks) {
        if (!received_.set_last_delivered(stream, f.sequence)) {
          log::logger()->warn("peer table full, cannot track stream from {}", f.source.c_str());
          return;
        }
        received_.accept(key);
        push_ready(key);
        drain(stream, f.sequence);
      } else {
        log::logger()->debug("rx: {}:{} early (last in order {}), buffered",
                             f.source.c_str(), f.sequence, has_last ? last : 0);
      }
    }
  }

  if (reliable) {
    uint32_t ack_seq = 0;
    if (!received_.last_delivered(stream, ack_seq)) ack_seq = 0;
    send_ack(f.source, f.port, ack_seq, now_ms);
  }
}

// drain() — advance last-delivered across buffered successors.
void Transport::drain(const StreamKey& stream, uint32_t from_seq) {
  RecordKey walk;
  walk.host = stream.host;
  walk.reliable = stream.reliable;
  walk.sequence = seq::next(from_seq, cfg_.max_sequence);

  for (size_t steps = 0; steps < ReceiveTable::CAPACITY; ++steps) {
    const ReceiveRecord* rec = received_.find(walk);
    if (!rec || rec->consumed) break;          // consumed: previous lap
    if (!received_.set_last_delivered(stream, walk.sequence)) break;
    received_.accept(walk);
    push_ready(walk);
    walk.sequence = seq::next(walk.sequence, cfg_.max_sequence);
  }
}

} // namespace viamesh
