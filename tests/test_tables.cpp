#include <doctest/doctest.h>
#include "viamesh/send_table.hpp"
#include "viamesh/receive_table.hpp"
#include <string>

using namespace viamesh;

static SendRecord pending_record(uint64_t now, bool syn = false) {
    SendRecord rec;
    rec.first_sent_ms = now;
    rec.last_tx_ms = now;
    rec.flags.requires_ack = true;
    rec.flags.syn = syn;
    rec.payload = "x";
    rec.pending = true;
    return rec;
}

static StreamKey reliable_stream(const char* host) {
    StreamKey k;
    k.host = host;
    k.reliable = true;
    return k;
}

static RecordKey key(const char* host, uint32_t seq, bool reliable = true) {
    RecordKey k;
    k.host = host;
    k.reliable = reliable;
    k.sequence = seq;
    return k;
}

static ReceiveRecord piece(const char* payload, bool more, uint16_t count = 0) {
    ReceiveRecord r;
    r.port = 4;
    r.payload = payload;
    r.flags.requires_ack = true;
    r.flags.more_fragments = more;
    r.flags.fragment_count = count;
    return r;
}

TEST_CASE("SendTable allocates SYN first, then consecutive sequences") {
    SendTable t;
    uint32_t seq = 0;
    bool syn = false;

    REQUIRE(t.next_sequence(reliable_stream("B"), 8, 7, seq, syn));
    CHECK(seq == 7);
    CHECK(syn);

    REQUIRE(t.next_sequence(reliable_stream("B"), 8, 3, seq, syn));
    CHECK(seq == 8);
    CHECK_FALSE(syn);

    REQUIRE(t.next_sequence(reliable_stream("B"), 8, 3, seq, syn));
    CHECK(seq == 1);

    // the unreliable stream to the same peer is independent
    StreamKey plain = reliable_stream("B");
    plain.reliable = false;
    REQUIRE(t.next_sequence(plain, 8, 5, seq, syn));
    CHECK(seq == 5);
    CHECK(syn);
}

TEST_CASE("SendTable acknowledgment is cumulative") {
    SendTable t;
    const HostStr b("B");
    for (uint32_t s = 7; s <= 9; ++s) REQUIRE(t.store(b, s, pending_record(1000)));
    CHECK(t.pending_count() == 3);

    CHECK(t.acknowledge(b, 8, 100) == 2);          // 8 and 7
    CHECK_FALSE(t.find(b, 7)->pending);
    CHECK(t.find(b, 9)->pending);

    CHECK(t.acknowledge(b, 8, 100) == 0);          // duplicate ack
    CHECK(t.acknowledge(b, 9, 100) == 1);
    CHECK(t.pending_count() == 0);
    CHECK(t.size() == 3);                          // acked records stay until expiry
}

TEST_CASE("SendTable forces SYN on the oldest pending record for a stray ack") {
    SendTable t;
    const HostStr b("B");
    uint32_t seq = 0;
    bool syn = false;

    // 5 (acked), 6 and 7 pending
    for (int i = 0; i < 3; ++i) {
        REQUIRE(t.next_sequence(reliable_stream("B"), 100, 5, seq, syn));
        REQUIRE(t.store(b, seq, pending_record(1000, syn)));
    }
    REQUIRE(t.acknowledge(b, 5, 100) == 1);

    SUBCASE("ack right before the oldest pending record is in step") {
        CHECK_FALSE(t.force_syn(b, 5, 100));
        CHECK_FALSE(t.find(b, 6)->flags.syn);
    }
    SUBCASE("ack naming nothing restarts the stream at the oldest pending") {
        CHECK(t.force_syn(b, 0, 100));
        CHECK(t.find(b, 6)->flags.syn);
        CHECK_FALSE(t.find(b, 7)->flags.syn);
        CHECK_FALSE(t.force_syn(b, 0, 100));       // already marked
    }
}

TEST_CASE("SendTable expiry reports only records still pending") {
    SendTable t;
    const HostStr b("B");
    REQUIRE(t.store(b, 1, pending_record(1000)));
    REQUIRE(t.store(b, 2, pending_record(1000)));
    REQUIRE(t.store(b, 3, pending_record(5000)));
    t.acknowledge(b, 1, 100);

    SendTable::ExpiredList lost;
    CHECK(t.expire(13000, 12000, lost) == 0);
    CHECK(t.expire(13001, 12000, lost) == 2);
    REQUIRE(lost.size() == 1);
    CHECK(lost.front().sequence == 2);
    CHECK(t.size() == 1);
}

TEST_CASE("SendTable reserve reclaims acknowledged records but never pending ones") {
    SendTable t;
    const HostStr b("B");
    for (uint32_t s = 1; s <= SendTable::CAPACITY; ++s) {
        REQUIRE(t.store(b, s, pending_record(1000 + s)));
    }
    CHECK_FALSE(t.reserve(1));

    t.acknowledge(b, 2, 1000);                     // frees 1 and 2
    CHECK(t.reserve(2));
    CHECK(t.size() == SendTable::CAPACITY - 2);
    CHECK_FALSE(t.reserve(3));
    CHECK_FALSE(t.reserve(SendTable::CAPACITY + 1));
}

TEST_CASE("ReceiveTable reassembles a complete fragment chain once") {
    ReceiveTable t;
    REQUIRE(t.store(key("A", 4), piece("he", true)));
    REQUIRE(t.store(key("A", 6), piece("o!", false, 3)));

    uint16_t port = 0;
    std::string msg;
    CHECK_FALSE(t.take_message(key("A", 4), 100, port, msg));   // 5 missing
    CHECK_FALSE(t.take_message(key("A", 6), 100, port, msg));

    REQUIRE(t.store(key("A", 5), piece("ll", true)));
    REQUIRE(t.take_message(key("A", 5), 100, port, msg));
    CHECK(msg == "hello!");
    CHECK(port == 4);

    CHECK(t.find(key("A", 4))->consumed);
    CHECK(t.find(key("A", 6))->payload.empty());
    CHECK_FALSE(t.take_message(key("A", 6), 100, port, msg));
}

TEST_CASE("ReceiveTable reassembles across the sequence wrap") {
    ReceiveTable t;
    REQUIRE(t.store(key("A", 8), piece("ab", true)));
    REQUIRE(t.store(key("A", 1), piece("cd", false, 2)));

    uint16_t port = 0;
    std::string msg;
    REQUIRE(t.take_message(key("A", 8), 8, port, msg));
    CHECK(msg == "abcd");
}

TEST_CASE("ReceiveTable refuses a chain broken by another message") {
    ReceiveTable t;
    REQUIRE(t.store(key("A", 1), piece("single", false)));   // not a fragment
    REQUIRE(t.store(key("A", 2), piece("xx", false, 2)));    // claims 1 as its head

    uint16_t port = 0;
    std::string msg;
    CHECK_FALSE(t.take_message(key("A", 2), 100, port, msg));
    REQUIRE(t.take_message(key("A", 1), 100, port, msg));
    CHECK(msg == "single");
}

TEST_CASE("ReceiveTable tracks last delivered per stream and ages records out") {
    ReceiveTable t;
    uint32_t last = 0;
    CHECK_FALSE(t.last_delivered(reliable_stream("A"), last));
    REQUIRE(t.set_last_delivered(reliable_stream("A"), 9));
    REQUIRE(t.last_delivered(reliable_stream("A"), last));
    CHECK(last == 9);

    ReceiveRecord r = piece("p", false);
    r.arrived_ms = 1000;
    REQUIRE(t.store(key("A", 9), r));
    CHECK(t.evict(13000, 12000) == 0);
    CHECK(t.evict(13001, 12000) == 1);
    CHECK(t.size() == 0);
}

TEST_CASE("ReceiveTable makes room for a stream start by dropping the furthest early record") {
    ReceiveTable t;
    // one accepted unreliable piece from B, the rest early records from A
    ReceiveRecord other = piece("b", true);
    other.flags.requires_ack = false;
    other.accepted = true;
    REQUIRE(t.store(key("B", 3, false), other));
    for (uint32_t s = 2; t.size() < ReceiveTable::CAPACITY; ++s) {
        REQUIRE(t.store(key("A", s), piece("a", false)));
    }
    const uint32_t furthest = static_cast<uint32_t>(ReceiveTable::CAPACITY);   // 2..64

    CHECK_FALSE(t.store(key("A", 1), piece("start", false)));
    REQUIRE(t.displace_early(key("A", 1), 0xFFFFFFFFu));
    CHECK(t.find(key("A", furthest)) == nullptr);
    CHECK(t.find(key("A", furthest - 1)) != nullptr);
    CHECK(t.find(key("B", 3, false)) != nullptr);
    REQUIRE(t.store(key("A", 1), piece("start", false)));

    // accepted and consumed records are never displaced
    for (uint32_t s = 1; s < furthest; ++s) REQUIRE(t.accept(key("A", s)));
    CHECK_FALSE(t.displace_early(key("A", furthest), 0xFFFFFFFFu));
}

TEST_CASE("ReceiveTable keeps the accepted mark when a copy replaces a record") {
    ReceiveTable t;
    REQUIRE(t.store(key("A", 7), piece("x", false)));
    REQUIRE(t.accept(key("A", 7)));
    REQUIRE(t.store(key("A", 7), piece("x", false)));
    CHECK(t.find(key("A", 7))->accepted);
    CHECK_FALSE(t.accept(key("A", 8)));

    // a consumed record replaced by the next lap starts over as early
    uint16_t port = 0;
    std::string msg;
    REQUIRE(t.take_message(key("A", 7), 0xFFFFFFFFu, port, msg));
    REQUIRE(t.store(key("A", 7), piece("y", false)));
    CHECK_FALSE(t.find(key("A", 7))->accepted);
    CHECK_FALSE(t.find(key("A", 7))->consumed);
}
