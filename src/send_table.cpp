// -----------------------------------------------------------------------------
// send_table.cpp — send sequences, retransmission buffer, ack bookkeeping
// API & operation table: see include/viamesh/send_table.hpp
// -----------------------------------------------------------------------------
#include "viamesh/send_table.hpp"
#include "viamesh/sequence.hpp"
#include "etl/vector.h"

namespace viamesh {

namespace {

RecordKey key_of(const HostStr& host, uint32_t seq) {
  RecordKey k;
  k.host = host;
  k.reliable = true;               // only reliable sends are recorded
  k.sequence = seq;
  return k;
}

} // namespace

bool SendTable::next_sequence(const StreamKey& stream, uint32_t max_seq, uint32_t random_start,
                              uint32_t& seq, bool& syn) {
  auto it = last_sent_.find(stream);
  if (it != last_sent_.end()) {
    seq = seq::next(it->second, max_seq);
    syn = false;
    it->second = seq;
    return true;
  }

  if (last_sent_.full()) return false;
  seq = random_start;
  syn = true;
  last_sent_.insert(std::make_pair(stream, seq));
  return true;
}

bool SendTable::last_sent(const StreamKey& stream, uint32_t& out) const {
  auto it = last_sent_.find(stream);
  if (it == last_sent_.end()) return false;
  out = it->second;
  return true;
}

bool SendTable::peer_table_full(const StreamKey& stream) const {
  return last_sent_.full() && last_sent_.find(stream) == last_sent_.end();
}

// -----------------------------------------------------------------------------
// reserve() — POLICY: only acknowledged records are reclaimed, oldest first.
// A pending record is never dropped early to make room.
// -----------------------------------------------------------------------------
bool SendTable::reserve(size_t n) {
  if (n > CAPACITY) return false;

  while (records_.available() < n) {
    auto victim = records_.end();
    for (auto it = records_.begin(); it != records_.end(); ++it) {
      if (it->second.pending) continue;
      if (victim == records_.end() || it->second.first_sent_ms < victim->second.first_sent_ms) {
        victim = it;
      }
    }
    if (victim == records_.end()) return false;   // everything left is in flight
    const RecordKey k = victim->first;
    records_.erase(k);
  }
  return true;
}

bool SendTable::store(const HostStr& host, uint32_t seq, const SendRecord& rec) {
  const RecordKey k = key_of(host, seq);
  auto it = records_.find(k);
  if (it != records_.end()) {
    it->second = rec;
    return true;
  }
  if (records_.full()) return false;
  records_.insert(std::make_pair(k, rec));
  return true;
}

SendRecord* SendTable::find(const HostStr& host, uint32_t seq) {
  auto it = records_.find(key_of(host, seq));
  return it == records_.end() ? nullptr : &it->second;
}

const SendRecord* SendTable::find(const HostStr& host, uint32_t seq) const {
  auto it = records_.find(key_of(host, seq));
  return it == records_.end() ? nullptr : &it->second;
}

bool SendTable::is_pending(const HostStr& host, uint32_t seq) const {
  const SendRecord* rec = find(host, seq);
  return rec && rec->pending;
}

// acknowledge() — walk backward from seq while records are still pending.
size_t SendTable::acknowledge(const HostStr& host, uint32_t seq, uint32_t max_seq) {
  size_t n = 0;
  for (size_t steps = 0; steps < CAPACITY; ++steps) {
    SendRecord* rec = find(host, seq);
    if (!rec || !rec->pending) break;
    rec->pending = false;
    rec->payload.clear();
    ++n;
    seq = seq::prev(seq, max_seq);
  }
  return n;
}

// -----------------------------------------------------------------------------
// force_syn()
// PRE:  ack_seq matched no record of host.
// POLICY:
//   - Start from the last sequence sent on the reliable stream and walk back
//     over pending records to the oldest one ("first").
//   - If the ack names the sequence just before first, the receiver is in
//     step and only missing data: nothing to do.
//   - Otherwise the receiver lost the stream start; SYN on first restarts it.
// -----------------------------------------------------------------------------
bool SendTable::force_syn(const HostStr& host, uint32_t ack_seq, uint32_t max_seq) {
  StreamKey stream;
  stream.host = host;
  stream.reliable = true;

  uint32_t first = 0;
  if (!last_sent(stream, first)) return false;
  if (!is_pending(host, first)) return false;     // nothing in flight

  for (size_t steps = 0; steps < CAPACITY; ++steps) {
    const uint32_t before = seq::prev(first, max_seq);
    if (!is_pending(host, before)) break;
    first = before;
  }

  if (ack_seq == seq::prev(first, max_seq)) return false;

  SendRecord* rec = find(host, first);
  if (!rec || rec->flags.syn) return false;
  rec->flags.syn = true;
  return true;
}

size_t SendTable::expire(uint64_t now_ms, uint64_t drop_ms, ExpiredList& out) {
  etl::vector<RecordKey, CAPACITY> doomed;

  for (const auto& entry : records_) {
    const SendRecord& rec = entry.second;
    if (now_ms <= rec.first_sent_ms + drop_ms) continue;
    doomed.push_back(entry.first);
    if (rec.pending && !out.full()) {
      ExpiredSend lost;
      lost.host = entry.first.host;
      lost.sequence = entry.first.sequence;
      lost.port = rec.port;
      lost.payload = rec.payload;
      out.push_back(lost);
    }
  }

  for (const RecordKey& k : doomed) records_.erase(k);
  return doomed.size();
}

size_t SendTable::pending_count() const {
  size_t n = 0;
  for (const auto& entry : records_) {
    if (entry.second.pending) ++n;
  }
  return n;
}

} // namespace viamesh
