#include <doctest/doctest.h>
#include "sim_mesh.hpp"
#include "viamesh/frame.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace viamesh;
using viamesh::medium::SimHub;
using simtest::collect;
using simtest::node_config;

namespace {

Frame decode(const std::vector<uint8_t>& bytes) {
    Frame f;
    REQUIRE(decode_frame(bytes.data(), bytes.size(), f) == FrameStatus::Ok);
    return f;
}

struct Loss {
    Handle      handle;
    uint16_t    port;
    std::string payload;
};

} // namespace

TEST_CASE("Reliable send with wait returns once the peer has acknowledged") {
    SimHub hub;
    auto& ma = hub.attach("A");
    auto& mb = hub.attach("B");
    hub.link("A", "B");
    Transport a(node_config("A", 1), ma, hub);
    Transport b(node_config("B", 2), mb, hub);

    int losses = 0;
    a.set_connection_lost_handler([&](const Handle&, uint16_t, const std::string&) { ++losses; });

    // B runs whenever A is waiting on an empty medium
    std::vector<Delivery> at_b;
    hub.set_idle_hook([&] {
        Delivery d;
        if (b.receive(0, d)) at_b.push_back(d);
    });

    SendResult r = a.send("B", 7, "x", true, true);
    REQUIRE(r.ok());
    CHECK(r.handle.host == HostStr("B"));
    CHECK(a.ack_state(r.handle) == AckState::Acknowledged);

    REQUIRE(at_b.size() == 1);
    CHECK(at_b[0].host == HostStr("A"));
    CHECK(at_b[0].port == 7);
    CHECK(at_b[0].message == "x");

    // run A well past the drop horizon: the acked send is never reported lost
    hub.set_idle_hook(nullptr);
    collect(a, 150);
    CHECK(losses == 0);
    CHECK(a.stats().timeouts == 0);
    CHECK(a.stats().retransmissions == 0);
    CHECK(a.ack_state(r.handle) == AckState::Unknown);   // record aged out
}

TEST_CASE("Acknowledgment is processed by the sender's next receive") {
    SimHub hub;
    auto& ma = hub.attach("A");
    auto& mb = hub.attach("B");
    hub.link("A", "B");
    Transport a(node_config("A", 1), ma, hub);
    Transport b(node_config("B", 2), mb, hub);

    SendResult r = a.send("B", 1, "one", true);
    REQUIRE(r.ok());
    CHECK(a.ack_state(r.handle) == AckState::Pending);

    Delivery d;
    REQUIRE(b.receive(100, d));
    CHECK(d.message == "one");

    CHECK_FALSE(a.receive(100, d));
    CHECK(a.ack_state(r.handle) == AckState::Acknowledged);
}

TEST_CASE("Waiting send to an absent host times out and reports the loss") {
    SimHub hub;
    auto& ma = hub.attach("A");
    Transport a(node_config("A", 1), ma, hub);

    std::vector<Loss> lost;
    a.set_connection_lost_handler([&](const Handle& h, uint16_t port, const std::string& p) {
        lost.push_back(Loss{h, port, p});
    });

    SendResult r = a.send("NOBODY", 4, "anyone?", true, true);
    CHECK(r.status == SendStatus::TimedOut);
    REQUIRE(lost.size() == 1);
    CHECK(lost[0].handle == r.handle);
    CHECK(lost[0].port == 4);
    CHECK(lost[0].payload == "anyone?");
    CHECK(hub.now_ms() > 1000 + 12000);
}

TEST_CASE("Unacknowledged packets are retransmitted with new ids, then reported lost") {
    SimHub hub;
    auto& ma = hub.attach("A");
    hub.attach("B");                               // hears A, never answers
    hub.link("A", "B");
    Transport a(node_config("A", 1), ma, hub);

    simtest::FrameLog tx;
    hub.set_filter(simtest::tap("A", "B", tx, true));

    int default_handler_calls = 0;
    a.set_connection_lost_handler([&](const Handle&, uint16_t, const std::string&) {
        ++default_handler_calls;
    });
    std::vector<Loss> lost;
    const LossCallback on_lost = [&](const Handle& h, uint16_t port, const std::string& p) {
        lost.push_back(Loss{h, port, p});
    };

    REQUIRE(hub.now_ms() == 1000);
    SendResult r = a.send("B", 3, "ping", true);
    REQUIRE(r.ok());

    Delivery d;
    while (hub.now_ms() < 5000) a.receive(1000, d, on_lost);
    CHECK(tx.size() == 1);                         // nothing before the interval has passed

    a.receive(1000, d, on_lost);                   // housekeeping at t=5000
    CHECK(tx.size() == 2);

    while (hub.now_ms() <= 13000) a.receive(1000, d, on_lost);
    CHECK(tx.size() == 4);                         // 5000, 9000, 13000
    CHECK(lost.empty());
    CHECK(a.ack_state(r.handle) == AckState::Pending);

    a.receive(1000, d, on_lost);                   // t=14000 is past 1000 + 12000
    REQUIRE(lost.size() == 1);
    CHECK(lost[0].handle == r.handle);
    CHECK(lost[0].port == 3);
    CHECK(lost[0].payload == "ping");
    CHECK(default_handler_calls == 0);
    CHECK(a.ack_state(r.handle) == AckState::Unknown);
    CHECK(a.stats().retransmissions == 3);
    CHECK(a.stats().timeouts == 1);

    const Frame first = decode(tx[0]);
    for (size_t i = 1; i < tx.size(); ++i) {
        const Frame again = decode(tx[i]);
        CHECK(again.sequence == first.sequence);
        CHECK(again.id != first.id);
        CHECK(again.flags == first.flags);
        CHECK(std::string(again.payload.c_str()) == "ping");
    }
}

TEST_CASE("A duplicated reliable packet is delivered once and acked again") {
    SimHub hub;
    auto& ma = hub.attach("A");
    auto& mb = hub.attach("B");
    hub.link("A", "B");
    Transport a(node_config("A", 1), ma, hub);
    Transport b(node_config("B", 2), mb, hub);

    simtest::FrameLog to_b;
    simtest::FrameLog acks;
    hub.set_filter([&](const std::string& from, const std::string&, const std::vector<uint8_t>& f) {
        (from == "A" ? to_b : acks).push_back(f);
        return true;
    });

    REQUIRE(a.send("B", 2, "once", true).ok());
    REQUIRE(collect(b, 1).size() == 1);
    REQUIRE(to_b.size() == 1);
    CHECK(acks.size() == 1);

    SUBCASE("same packet id") {
        hub.inject("B", to_b[0]);
        CHECK(collect(b, 2).empty());
        CHECK(b.stats().duplicates_dropped == 1);
        CHECK(acks.size() == 1);                   // dropped before the receive engine
    }
    SUBCASE("retransmission with a fresh id") {
        Frame f = decode(to_b[0]);
        f.id ^= 0x5A5A5A5Au;
        FrameBytes bytes;
        REQUIRE(encode_frame(f, bytes));
        hub.inject("B", std::vector<uint8_t>(bytes.begin(), bytes.end()));
        CHECK(collect(b, 2).empty());
        REQUIRE(acks.size() == 2);
        CHECK(decode(acks[1]).sequence == f.sequence);   // still acks the same point
    }

    // the in-order pointer did not move twice: the next message is delivered
    REQUIRE(a.send("B", 2, "twice", true).ok());
    auto got = collect(b, 2);
    REQUIRE(got.size() == 1);
    CHECK(got[0].message == "twice");
}

TEST_CASE("Reordered reliable packets are delivered in transmission order") {
    SimHub hub;
    auto& ma = hub.attach("A");
    auto& mb = hub.attach("B");
    hub.link("A", "B");
    Transport a(node_config("A", 1), ma, hub);
    Transport b(node_config("B", 2), mb, hub);

    simtest::FrameLog held;
    hub.set_filter(simtest::tap("A", "B", held, false));

    for (const char* m : {"m1", "m2", "m3"}) REQUIRE(a.send("B", 1, m, true).ok());
    REQUIRE(held.size() == 3);
    hub.inject("B", held[2]);
    hub.inject("B", held[1]);
    hub.inject("B", held[0]);

    auto got = collect(b, 5);
    REQUIRE(got.size() == 3);
    CHECK(got[0].message == "m1");
    CHECK(got[1].message == "m2");
    CHECK(got[2].message == "m3");

    // the cumulative acks settle every send
    collect(a, 5);
    CHECK(a.stats().retransmissions == 0);
}

TEST_CASE("Sequences wrap past max_sequence without losing order") {
    SimHub hub;
    auto& ma = hub.attach("A");
    auto& mb = hub.attach("B");
    hub.link("A", "B");
    TransportConfig cfg_a = node_config("A", 1);
    TransportConfig cfg_b = node_config("B", 2);
    cfg_a.max_sequence = 8;
    cfg_b.max_sequence = 8;
    Transport a(cfg_a, ma, hub);
    Transport b(cfg_b, mb, hub);

    std::vector<Delivery> at_b;
    hub.set_idle_hook([&] {
        Delivery d;
        if (b.receive(0, d)) at_b.push_back(d);
    });

    simtest::FrameLog tx;
    hub.set_filter(simtest::tap("A", "B", tx, true));

    const int total = 8 + 5;
    for (int i = 0; i < total; ++i) {
        SendResult r = a.send("B", 6, "n" + std::to_string(i), true, true);
        REQUIRE(r.ok());
        CHECK(r.handle.sequence >= 1);
        CHECK(r.handle.sequence <= 8);
    }

    REQUIRE(at_b.size() == static_cast<size_t>(total));
    for (int i = 0; i < total; ++i) CHECK(at_b[i].message == "n" + std::to_string(i));

    // consecutive sequences, wrapping 8 -> 1
    for (size_t i = 1; i < tx.size(); ++i) {
        const uint32_t prev = decode(tx[i - 1]).sequence;
        CHECK(decode(tx[i]).sequence == (prev == 8 ? 1u : prev + 1));
    }
    CHECK(a.stats().timeouts == 0);
}

TEST_CASE("Several packets in flight across the wrap, reordered after it, arrive in order") {
    SimHub hub;
    auto& ma = hub.attach("A");
    auto& mb = hub.attach("B");
    hub.link("A", "B");
    TransportConfig cfg_a = node_config("A", 1);
    TransportConfig cfg_b = node_config("B", 2);
    cfg_a.max_sequence = cfg_b.max_sequence = 8;
    Transport a(cfg_a, ma, hub);
    Transport b(cfg_b, mb, hub);

    std::vector<std::string> got;
    auto exchange = [&](size_t until) {
        Delivery d;
        for (int round = 0; round < 400 && got.size() < until; ++round) {
            if (b.receive(50, d)) got.push_back(d.message);
            a.receive(50, d);
        }
        for (int i = 0; i < 4; ++i) a.receive(50, d);   // settle the last acks
    };
    auto send_batch = [&](int first, std::vector<uint32_t>& seqs) {
        for (int i = first; i < first + 6; ++i) {
            SendResult r = a.send("B", 4, "n" + std::to_string(i), true);
            REQUIRE(r.ok());
            seqs.push_back(r.handle.sequence);
        }
    };

    // six in flight, delivered as sent
    std::vector<uint32_t> lap1;
    send_batch(0, lap1);
    exchange(6);
    REQUIRE(got.size() == 6);

    // the next six reuse sequence numbers of the first batch and arrive backwards
    std::vector<uint32_t> lap2;
    simtest::FrameLog held;
    hub.set_filter(simtest::tap("A", "B", held, false));
    send_batch(6, lap2);
    hub.set_filter(nullptr);
    REQUIRE(held.size() == 6);
    CHECK(lap2[2] == lap1[0]);
    CHECK(lap2[5] == lap1[3]);
    for (size_t i = held.size(); i-- > 0;) hub.inject("B", held[i]);
    exchange(12);

    // and six more in order, again over records left from the previous lap
    std::vector<uint32_t> lap3;
    send_batch(12, lap3);
    exchange(18);

    REQUIRE(got.size() == 18);
    for (size_t i = 0; i < got.size(); ++i) CHECK(got[i] == "n" + std::to_string(i));
    CHECK(a.stats().timeouts == 0);
    for (uint32_t s : lap3) CHECK(a.ack_state(Handle{HostStr("B"), s}) == AckState::Acknowledged);
}

TEST_CASE("A full receive table still lets the missing stream start through") {
    SimHub hub;
    auto& ma = hub.attach("A");
    auto& mb = hub.attach("B");
    hub.link("A", "B");
    Transport a(node_config("A", 1), ma, hub);
    Transport b(node_config("B", 2), mb, hub);

    // a lone first fragment from C holds one slot until it ages out
    Frame stray;
    stray.id = 0xC0FFEE01u;
    stray.sequence = 5;
    stray.flags.more_fragments = true;
    stray.destination = "B";
    stray.source = "C";
    stray.port = 1;
    stray.payload = "x";
    FrameBytes stray_bytes;
    REQUIRE(encode_frame(stray, stray_bytes));
    hub.inject("B", std::vector<uint8_t>(stray_bytes.begin(), stray_bytes.end()));

    // the very first packet of A's stream (the SYN) is lost
    int a_to_b = 0;
    hub.set_filter([&](const std::string& from, const std::string& to, const std::vector<uint8_t>&) {
        return !(from == "A" && to == "B" && a_to_b++ == 0);
    });

    const size_t total = Transport::MAX_FRAGMENTS;
    std::vector<Handle> handles;
    for (size_t i = 0; i < total; ++i) {
        SendResult r = a.send("B", 3, "m" + std::to_string(i), true);
        REQUIRE(r.ok());
        handles.push_back(r.handle);
    }

    std::vector<std::string> got;
    Delivery d;
    for (int round = 0; round < 2000 && got.size() < total; ++round) {
        if (b.receive(50, d)) got.push_back(d.message);
        a.receive(50, d);
    }
    for (int i = 0; i < 4; ++i) a.receive(50, d);

    REQUIRE(got.size() == total);
    for (size_t i = 0; i < total; ++i) CHECK(got[i] == "m" + std::to_string(i));
    CHECK(a.stats().timeouts == 0);
    CHECK(hub.now_ms() < 1000 + 12000);
    for (const Handle& h : handles) CHECK(a.ack_state(h) == AckState::Acknowledged);
}

TEST_CASE("A restarted receiver is resynchronised by a forced SYN") {
    SimHub hub;
    auto& ma = hub.attach("A");
    auto& mb = hub.attach("B");
    hub.link("A", "B");
    Transport a(node_config("A", 1), ma, hub);
    auto b = std::make_unique<Transport>(node_config("B", 2), mb, hub);

    SendResult first = a.send("B", 1, "one", true);
    REQUIRE(first.ok());
    REQUIRE(collect(*b, 1).size() == 1);
    collect(a, 1);
    REQUIRE(a.ack_state(first.handle) == AckState::Acknowledged);

    // B forgets everything; A's next packet carries no SYN
    b = std::make_unique<Transport>(node_config("B", 3), mb, hub);
    SendResult second = a.send("B", 1, "two", true);
    REQUIRE(second.ok());

    Delivery d;
    CHECK_FALSE(b->receive(100, d));               // buffered, acked with 0
    CHECK_FALSE(a.receive(100, d));
    CHECK(a.stats().desyncs_repaired == 1);

    std::vector<Delivery> got;
    for (int i = 0; i < 40 && got.empty(); ++i) {
        if (b->receive(100, d)) got.push_back(d);
        a.receive(100, d);
    }
    REQUIRE(got.size() == 1);
    CHECK(got[0].message == "two");

    for (int i = 0; i < 5 && a.ack_state(second.handle) != AckState::Acknowledged; ++i) {
        a.receive(100, d);
    }
    CHECK(a.ack_state(second.handle) == AckState::Acknowledged);
    CHECK(a.stats().timeouts == 0);
}
