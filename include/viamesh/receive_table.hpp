/**
 * @file receive_table.hpp
 * @brief ReceiveTable — buffered inbound fragments, in-order cursors and reassembly.
 *
 * @details
 * Every data frame addressed to this host lands here as a ReceiveRecord keyed
 * by (source, reliability, sequence). A record stays until the drop horizon;
 * once its payload has been handed to the application it is marked consumed,
 * which is how a retransmitted copy is recognised and ignored.
 *
 * Reliable streams also keep the last sequence delivered in order. The
 * transport advances it on SYN or on the expected successor, then drains
 * buffered successors.
 *
 * Reassembly (take_message) works from any record of a chain:
 *   1. walk forward across more-fragments records to the terminal one,
 *   2. walk back `fragment_count` records and check all are present,
 *   3. concatenate in sequence order and mark them consumed.
 */
#ifndef VIAMESH_RECEIVE_TABLE_HPP
#define VIAMESH_RECEIVE_TABLE_HPP

#include "viamesh/types.hpp"
#include "viamesh/packet_flags.hpp"
#include "viamesh/stream_key.hpp"
#include "etl/map.h"
#include <stdint.h>
#include <stddef.h>
#include <string>

namespace viamesh {

struct ReceiveRecord {
  uint64_t    arrived_ms{0};
  PacketFlags flags;
  uint16_t    port{0};
  PayloadStr  payload;
  bool        accepted{false};   ///< unreliable, or reached in order; otherwise buffered early
  bool        consumed{false};
};

class ReceiveTable {
public:
  static constexpr size_t CAPACITY      = 64;  ///< Max buffered records
  static constexpr size_t PEER_CAPACITY = 32;  ///< Max reliable streams tracked

  ReceiveRecord* find(const RecordKey& key);
  const ReceiveRecord* find(const RecordKey& key) const;

  /**
   * @brief Insert or replace a record. When full, consumed records are
   *        reclaimed oldest first.
   *
   * Replacing an unconsumed record keeps its accepted mark.
   * @return false if no slot could be freed
   */
  bool store(const RecordKey& key, const ReceiveRecord& rec);

  /// Mark the record at @p key as accepted. False if there is none.
  bool accept(const RecordKey& key);

  /**
   * @brief Free one slot held by a reliable record buffered ahead of its stream.
   *
   * Used when a frame that unblocks a stream (SYN or the expected successor)
   * finds the table full of early records. The victim is the early record of
   * the same stream furthest ahead of @p incoming; failing that, the latest
   * early arrival of any stream. Its sender still has it pending (acks are
   * cumulative and never covered it) and will retransmit it.
   *
   * @return false if no early record exists
   */
  bool displace_early(const RecordKey& incoming, uint32_t max_seq);

  bool last_delivered(const StreamKey& stream, uint32_t& out) const;

  /// False if the stream is new and the peer table is full.
  bool set_last_delivered(const StreamKey& stream, uint32_t seq);

  /**
   * @brief Reassemble the message containing the record at @p key.
   * @param port    OUT: application port of the message
   * @param message OUT: full message bytes
   * @return true if every fragment was present; they are now consumed
   */
  bool take_message(const RecordKey& key, uint32_t max_seq, uint16_t& port, std::string& message);

  /// Remove records that arrived more than @p drop_ms ago.
  size_t evict(uint64_t now_ms, uint64_t drop_ms);

  size_t size() const { return records_.size(); }

private:
  bool reclaim_consumed();

  etl::map<RecordKey, ReceiveRecord, CAPACITY>  records_;
  etl::map<StreamKey, uint32_t, PEER_CAPACITY>  last_delivered_;
};

} // namespace viamesh

#endif // VIAMESH_RECEIVE_TABLE_HPP
