#include <doctest/doctest.h>
#include "viamesh/sequence.hpp"
#include "viamesh/dedup_cache.hpp"

using namespace viamesh;

TEST_CASE("Sequence arithmetic wraps over [1, max]") {
    CHECK(seq::next(3, 8) == 4);
    CHECK(seq::next(8, 8) == 1);
    CHECK(seq::next(0, 8) == 1);
    CHECK(seq::prev(4, 8) == 3);
    CHECK(seq::prev(1, 8) == 8);

    const uint32_t max = 0xFFFFFFFFu;
    CHECK(seq::next(max, max) == 1);
    CHECK(seq::prev(1, max) == max);
    CHECK(seq::prev(max, max) == max - 1);

    for (uint32_t s = 1; s <= 8; ++s) {
        CHECK(seq::prev(seq::next(s, 8), 8) == s);
    }
}

TEST_CASE("DedupCache remembers ids until the horizon passes") {
    DedupCache cache;
    CHECK_FALSE(cache.seen(0x1234));

    cache.record(0x1234, 1000);
    cache.record(0x5678, 5000);
    CHECK(cache.seen(0x1234));
    CHECK(cache.size() == 2);

    // re-recording keeps the first sighting
    cache.record(0x1234, 9000);

    CHECK(cache.evict(13000, 12000) == 0);        // 13000 is not past 1000 + 12000
    CHECK(cache.evict(13001, 12000) == 1);
    CHECK_FALSE(cache.seen(0x1234));
    CHECK(cache.seen(0x5678));

    cache.clear();
    CHECK(cache.size() == 0);
}

TEST_CASE("DedupCache evicts the oldest id when full") {
    DedupCache cache;
    for (uint32_t i = 0; i < DedupCache::CAPACITY; ++i) {
        cache.record(100 + i, 1000 + i);
    }
    REQUIRE(cache.size() == DedupCache::CAPACITY);

    cache.record(0xFFFF0000u, 50000);
    CHECK(cache.size() == DedupCache::CAPACITY);
    CHECK_FALSE(cache.seen(100));                  // oldest went
    CHECK(cache.seen(101));
    CHECK(cache.seen(0xFFFF0000u));
}
