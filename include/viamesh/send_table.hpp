/**
 * @file send_table.hpp
 * @brief SendTable — per-peer send sequences and the reliable retransmission buffer.
 *
 * @details
 * Two pieces of state live here:
 *
 * - **Last sent sequence** per stream (peer + reliability). The first packet
 *   to a stream starts at a random sequence and carries SYN; every later
 *   packet takes the successor.
 * - **Send records** per reliable (peer, sequence): what was sent, when it was
 *   first sent, when it last went on the air, and whether it is still waiting
 *   for an ack. Acked records keep their slot (payload cleared) until the drop
 *   horizon so late duplicate acks find them and are ignored.
 *
 * The table never transmits anything. The transport asks it what is due
 * (for_each_due), what expired (expire), and tells it what was acked.
 *
 * | Operation        | Effect                                                     |
 * |------------------|------------------------------------------------------------|
 * | `next_sequence`  | allocate the next sequence for a stream                    |
 * | `reserve`        | make room for N new records by reclaiming acked ones       |
 * | `acknowledge`    | cumulative ack: clear the named record and earlier ones    |
 * | `force_syn`      | desync repair: set SYN on the oldest pending record        |
 * | `expire`         | remove records past the drop horizon, report pending ones  |
 * | `for_each_due`   | visit pending records whose retransmit interval elapsed    |
 */
#ifndef VIAMESH_SEND_TABLE_HPP
#define VIAMESH_SEND_TABLE_HPP

#include "viamesh/types.hpp"
#include "viamesh/packet_flags.hpp"
#include "viamesh/stream_key.hpp"
#include "etl/map.h"
#include "etl/deque.h"
#include <stdint.h>
#include <stddef.h>

namespace viamesh {

struct SendRecord {
  uint64_t    first_sent_ms{0};
  uint64_t    last_tx_ms{0};
  uint32_t    packet_id{0};     ///< id of the latest transmission
  PacketFlags flags;
  uint16_t    port{0};
  PayloadStr  payload;          ///< cleared once acked
  bool        pending{true};
};

/// A pending record that reached the drop horizon without an ack.
struct ExpiredSend {
  HostStr    host;
  uint32_t   sequence{0};
  uint16_t   port{0};
  PayloadStr payload;
};

class SendTable {
public:
  static constexpr size_t CAPACITY      = 64;  ///< Max send records
  static constexpr size_t PEER_CAPACITY = 32;  ///< Max streams with a last-sent sequence

  using ExpiredList = etl::deque<ExpiredSend, CAPACITY>;

  /**
   * @brief Allocate the next sequence for @p stream.
   * @param random_start sequence to use when the stream is new, in [1, max_seq]
   * @param seq  OUT: allocated sequence
   * @param syn  OUT: true when this is the first packet of the stream
   * @return false if the stream is new and the peer table is full
   */
  bool next_sequence(const StreamKey& stream, uint32_t max_seq, uint32_t random_start,
                     uint32_t& seq, bool& syn);

  /// Last sequence allocated for @p stream; false if none yet.
  bool last_sent(const StreamKey& stream, uint32_t& out) const;

  /// True if a stream is new and no peer slot is left for it.
  bool peer_table_full(const StreamKey& stream) const;

  /// Ensure @p n free record slots, reclaiming acknowledged records oldest first.
  bool reserve(size_t n);

  /// Insert or replace the record for (host, seq). False only if the table is full.
  bool store(const HostStr& host, uint32_t seq, const SendRecord& rec);

  SendRecord* find(const HostStr& host, uint32_t seq);
  const SendRecord* find(const HostStr& host, uint32_t seq) const;

  /**
   * @brief Cumulative acknowledgment from @p host for @p seq.
   * @return number of records that moved from pending to acknowledged
   */
  size_t acknowledge(const HostStr& host, uint32_t seq, uint32_t max_seq);

  /**
   * @brief React to an ack that names no known record.
   *
   * Locates the oldest pending record of @p host. Unless @p ack_seq is the
   * sequence right before it, that record gets SYN so its next retransmission
   * restarts the receiver's stream.
   *
   * @return true if a SYN was forced
   */
  bool force_syn(const HostStr& host, uint32_t ack_seq, uint32_t max_seq);

  /**
   * @brief Remove every record first sent more than @p drop_ms ago.
   * @param out the removed records that were still pending are appended here
   *            (skipped if @p out is already full)
   * @return number of records removed (pending or not)
   */
  size_t expire(uint64_t now_ms, uint64_t drop_ms, ExpiredList& out);

  /**
   * @brief Call fn(host, seq, record) for each pending record last sent more
   *        than @p retransmit_ms ago. fn may modify the record but must not
   *        add or remove records.
   */
  template <typename Fn>
  size_t for_each_due(uint64_t now_ms, uint64_t retransmit_ms, Fn fn) {
    size_t n = 0;
    for (auto& entry : records_) {
      SendRecord& rec = entry.second;
      if (!rec.pending) continue;
      if (now_ms > rec.last_tx_ms + retransmit_ms) {
        fn(entry.first.host, entry.first.sequence, rec);
        ++n;
      }
    }
    return n;
  }

  size_t size() const { return records_.size(); }
  size_t pending_count() const;

private:
  bool is_pending(const HostStr& host, uint32_t seq) const;

  etl::map<RecordKey, SendRecord, CAPACITY>     records_;
  etl::map<StreamKey, uint32_t, PEER_CAPACITY>  last_sent_;
};

} // namespace viamesh

#endif // VIAMESH_SEND_TABLE_HPP
