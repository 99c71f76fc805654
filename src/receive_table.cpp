// -----------------------------------------------------------------------------
// receive_table.cpp — inbound record buffer and reassembly
// API: see include/viamesh/receive_table.hpp
// -----------------------------------------------------------------------------
#include "viamesh/receive_table.hpp"
#include "viamesh/sequence.hpp"
#include "etl/vector.h"

namespace viamesh {

ReceiveRecord* ReceiveTable::find(const RecordKey& key) {
  auto it = records_.find(key);
  return it == records_.end() ? nullptr : &it->second;
}

const ReceiveRecord* ReceiveTable::find(const RecordKey& key) const {
  auto it = records_.find(key);
  return it == records_.end() ? nullptr : &it->second;
}

bool ReceiveTable::store(const RecordKey& key, const ReceiveRecord& rec) {
  auto it = records_.find(key);
  if (it != records_.end()) {
    const bool was_accepted = it->second.accepted && !it->second.consumed;
    it->second = rec;
    if (was_accepted) it->second.accepted = true;
    return true;
  }
  if (records_.full() && !reclaim_consumed()) return false;
  records_.insert(std::make_pair(key, rec));
  return true;
}

bool ReceiveTable::accept(const RecordKey& key) {
  ReceiveRecord* rec = find(key);
  if (!rec) return false;
  rec->accepted = true;
  return true;
}

// -----------------------------------------------------------------------------
// displace_early()
// POLICY:
//   - Early = reliable, not accepted, not consumed.
//   - Same stream first, furthest ahead of the incoming sequence: that record
//     is the last one the stream will need.
//   - Otherwise the most recent early arrival of another stream.
// -----------------------------------------------------------------------------
bool ReceiveTable::displace_early(const RecordKey& incoming, uint32_t max_seq) {
  const StreamKey stream = incoming.stream();
  auto same = records_.end();
  auto other = records_.end();
  uint32_t best_gap = 0;

  for (auto it = records_.begin(); it != records_.end(); ++it) {
    const ReceiveRecord& r = it->second;
    if (!it->first.reliable || r.accepted || r.consumed) continue;
    if (it->first.stream() == stream) {
      const uint32_t gap = seq::ahead(incoming.sequence, it->first.sequence, max_seq);
      if (same == records_.end() || gap > best_gap) {
        same = it;
        best_gap = gap;
      }
    } else if (other == records_.end() || r.arrived_ms >= other->second.arrived_ms) {
      other = it;
    }
  }

  auto victim = same != records_.end() ? same : other;
  if (victim == records_.end()) return false;
  const RecordKey k = victim->first;
  records_.erase(k);
  return true;
}

// reclaim_consumed() — free one slot held by an already delivered record.
bool ReceiveTable::reclaim_consumed() {
  auto victim = records_.end();
  for (auto it = records_.begin(); it != records_.end(); ++it) {
    if (!it->second.consumed) continue;
    if (victim == records_.end() || it->second.arrived_ms < victim->second.arrived_ms) victim = it;
  }
  if (victim == records_.end()) return false;
  const RecordKey k = victim->first;
  records_.erase(k);
  return true;
}

bool ReceiveTable::last_delivered(const StreamKey& stream, uint32_t& out) const {
  auto it = last_delivered_.find(stream);
  if (it == last_delivered_.end()) return false;
  out = it->second;
  return true;
}

bool ReceiveTable::set_last_delivered(const StreamKey& stream, uint32_t seq) {
  auto it = last_delivered_.find(stream);
  if (it != last_delivered_.end()) {
    it->second = seq;
    return true;
  }
  if (last_delivered_.full()) return false;
  last_delivered_.insert(std::make_pair(stream, seq));
  return true;
}

// -----------------------------------------------------------------------------
// take_message()
// PRE:  key names a record that was accepted (unreliable, or in order).
// POLICY:
//   - Single packet: hand it over directly.
//   - Fragment: forward to the terminal, then back over `count` records.
//     Any gap or already consumed piece means "not yet"; nothing is touched.
//   - Walks are capped at CAPACITY steps; a chain longer than the table
//     can never be complete anyway.
// OUT:  pieces are consumed (payload released) only on success.
// -----------------------------------------------------------------------------
bool ReceiveTable::take_message(const RecordKey& key, uint32_t max_seq, uint16_t& port,
                                std::string& message) {
  ReceiveRecord* rec = find(key);
  if (!rec || rec->consumed) return false;

  if (!rec->flags.fragmented()) {
    port = rec->port;
    message.assign(rec->payload.data(), rec->payload.size());
    rec->payload.clear();
    rec->consumed = true;
    return true;
  }

  RecordKey cursor = key;
  for (size_t steps = 0; rec && rec->flags.more_fragments; ++steps) {
    if (steps >= CAPACITY) return false;
    cursor.sequence = seq::next(cursor.sequence, max_seq);
    rec = find(cursor);
  }
  if (!rec || rec->consumed || rec->flags.fragment_count == 0) return false;

  const size_t count = rec->flags.fragment_count;
  if (count > CAPACITY) return false;

  // verify every piece before consuming any
  RecordKey walk = cursor;
  for (size_t i = 0; i < count; ++i) {
    const ReceiveRecord* piece = find(walk);
    if (!piece || piece->consumed) return false;
    if (i > 0 && !piece->flags.more_fragments) return false;   // chain broken by another message
    walk.sequence = seq::prev(walk.sequence, max_seq);
  }

  port = rec->port;
  message.clear();
  for (size_t i = 0; i < count; ++i) {
    walk.sequence = seq::next(walk.sequence, max_seq);
    ReceiveRecord* piece = find(walk);
    message.append(piece->payload.data(), piece->payload.size());
    piece->payload.clear();
    piece->consumed = true;
  }
  return true;
}

size_t ReceiveTable::evict(uint64_t now_ms, uint64_t drop_ms) {
  etl::vector<RecordKey, CAPACITY> doomed;
  for (const auto& entry : records_) {
    if (now_ms > entry.second.arrived_ms + drop_ms) doomed.push_back(entry.first);
  }
  for (const RecordKey& k : doomed) records_.erase(k);
  return doomed.size();
}

} // namespace viamesh
