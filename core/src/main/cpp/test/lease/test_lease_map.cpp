/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <iterator>
#include <string>
#include <vector>
#include "lease/lease_map.hpp"

using namespace leasemap;
using ::testing::ElementsAre;
using ::testing::Pair;

namespace {

    // Steady clock the tests move by hand
    struct ManualClock {
        using duration = std::chrono::milliseconds;
        using rep = duration::rep;
        using period = duration::period;
        using time_point = std::chrono::time_point<ManualClock, duration>;
        static constexpr bool is_steady = true;

        static time_point current;
        static time_point now() { return current; }
        static void advance(duration d) { current += d; }
    };
    ManualClock::time_point ManualClock::current{};

}

class LeaseMapTest : public ::testing::Test {
protected:
    using Map = LeaseMap<std::string, ManualClock>;
    Map map;

    void SetUp() override {
        ManualClock::current = ManualClock::time_point{};
    }
};

TEST_F(LeaseMapTest, NewMapIsEmpty) {
    EXPECT_EQ(map.len(), 0u);
    EXPECT_EQ(map.capacity(), 0u);
    EXPECT_TRUE(map.is_empty());
}

TEST_F(LeaseMapTest, HotelScenario) {
    Map hotel = Map::with_capacity(0);
    SlotKey k0 = hotel.insert("a");
    SlotKey k1 = hotel.insert("b");
    EXPECT_EQ(k0.index(), 0u);
    EXPECT_EQ(k1.index(), 1u);

    std::optional<std::string> out = hotel.remove(k0);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "a");

    SlotKey k2 = hotel.insert("c");
    EXPECT_EQ(k2.index(), 0u);
    EXPECT_EQ(k2.generation(), k0.generation() + 1);

    EXPECT_EQ(hotel.get(k0), nullptr);
    ASSERT_NE(hotel.get(k2), nullptr);
    EXPECT_EQ(*hotel.get(k2), "c");
    EXPECT_EQ(hotel.len(), 2u);
}

TEST_F(LeaseMapTest, WithCapacityAssignsRoomsInOrder) {
    const size_t kCapacity = 10;
    LeaseMap<size_t, ManualClock> rooms = LeaseMap<size_t, ManualClock>::with_capacity(kCapacity);
    EXPECT_EQ(rooms.capacity(), kCapacity);

    for (size_t i = 0; i < kCapacity + 1; ++i) {
        EXPECT_EQ(rooms.insert(i).index(), i);
    }
    SlotKey three = SlotKey::from_parts(3, 0);
    EXPECT_EQ(rooms.remove(three), std::optional<size_t>(3));

    SlotKey reused = rooms.insert(0);
    EXPECT_EQ(reused.index(), 3u);
    EXPECT_EQ(rooms.insert(5).index(), kCapacity + 1);

    EXPECT_EQ(rooms.remove(reused), std::optional<size_t>(0));
    EXPECT_EQ(rooms.insert(0).index(), 3u);
}

TEST_F(LeaseMapTest, InsertCopyOfStoredValueWhileGrowing) {
    SlotKey k = map.insert(std::string(100, 'x'));
    SlotKey copy = map.insert(*map.get(k));

    ASSERT_NE(map.get(copy), nullptr);
    EXPECT_EQ(*map.get(copy), std::string(100, 'x'));
    EXPECT_EQ(*map.get(k), std::string(100, 'x'));
    EXPECT_EQ(map.capacity(), 2u);
}

TEST_F(LeaseMapTest, GetMutAndContains) {
    SlotKey k = map.insert("guest");
    EXPECT_TRUE(map.contains_key(k));
    *map.get_mut(k) = "vip";
    EXPECT_EQ(*map.get(k), "vip");

    map.remove(k);
    EXPECT_FALSE(map.contains_key(k));
    EXPECT_EQ(map.get_mut(k), nullptr);
}

TEST_F(LeaseMapTest, EmplaceForwardsArguments) {
    SlotKey k = map.emplace(2, 'z');
    EXPECT_EQ(*map.get(k), "zz");
}

TEST_F(LeaseMapTest, LeaseAgeFollowsClock) {
    SlotKey k = map.insert("guest");
    ManualClock::advance(std::chrono::milliseconds(250));

    std::optional<ManualClock::duration> age = map.lease_age(k);
    ASSERT_TRUE(age.has_value());
    EXPECT_EQ(*age, std::chrono::milliseconds(250));

    map.remove(k);
    EXPECT_FALSE(map.lease_age(k).has_value());
}

TEST_F(LeaseMapTest, EvictOlderThanDropsOverstayingGuests) {
    SlotKey early = map.insert("early");
    ManualClock::advance(std::chrono::milliseconds(100));
    SlotKey middle = map.insert("middle");
    ManualClock::advance(std::chrono::milliseconds(100));
    SlotKey late = map.insert("late");
    ManualClock::advance(std::chrono::milliseconds(50));

    // ages: early 250ms, middle 150ms, late 50ms
    EXPECT_EQ(map.evict_older_than(std::chrono::milliseconds(150)), 1u);
    EXPECT_FALSE(map.contains_key(early));
    EXPECT_TRUE(map.contains_key(middle));  // exactly at the limit stays
    EXPECT_TRUE(map.contains_key(late));

    EXPECT_EQ(map.evict_older_than(std::chrono::milliseconds(10)), 2u);
    EXPECT_TRUE(map.is_empty());
    EXPECT_EQ(map.capacity(), 3u);

    LeaseMapStats s = map.get_stats();
    EXPECT_EQ(s.total_evictions, 3u);
    EXPECT_EQ(s.eviction_sweeps, 2u);
    EXPECT_EQ(s.total_removes, 3u);
}

TEST_F(LeaseMapTest, EvictedRoomIsReusedWithNewGeneration) {
    SlotKey old_key = map.insert("old");
    ManualClock::advance(std::chrono::seconds(5));
    map.insert("fresh");
    ManualClock::advance(std::chrono::seconds(1));

    ASSERT_EQ(map.evict_older_than(std::chrono::seconds(3)), 1u);
    SlotKey next = map.insert("next");
    EXPECT_EQ(next.index(), old_key.index());
    EXPECT_NE(next, old_key);
    EXPECT_EQ(map.get(old_key), nullptr);
    EXPECT_EQ(*map.get(next), "next");
}

TEST_F(LeaseMapTest, EvictNothingOnEmptyMap) {
    EXPECT_EQ(map.evict_older_than(std::chrono::milliseconds(0)), 0u);
}

TEST_F(LeaseMapTest, ReinsertRestartsLeaseClock) {
    SlotKey k = map.insert("guest");
    ManualClock::advance(std::chrono::seconds(10));
    std::string v = *map.remove(k);
    SlotKey again = map.insert(v);

    EXPECT_EQ(map.evict_older_than(std::chrono::seconds(1)), 0u);
    EXPECT_TRUE(map.contains_key(again));
}

TEST_F(LeaseMapTest, IterationYieldsValuesInIndexOrder) {
    SlotKey a = map.insert("a");
    SlotKey b = map.insert("b");
    SlotKey c = map.insert("c");
    map.remove(b);

    std::vector<std::pair<SlotKey, std::string>> seen;
    for (auto entry : map) {
        seen.emplace_back(entry.first, entry.second);
    }
    EXPECT_THAT(seen, ElementsAre(Pair(a, "a"), Pair(c, "c")));

    for (auto [key, value] : map) {
        value = value + value;
    }
    EXPECT_EQ(*map.get(c), "cc");

    const Map& view = map;
    size_t n = 0;
    for (auto it = view.begin(); it != view.end(); ++it) {
        ++n;
    }
    EXPECT_EQ(n, 2u);
}

TEST_F(LeaseMapTest, MutableIteratorConvertsToConst) {
    SlotKey a = map.insert("a");
    map.insert("b");

    Map::const_iterator it = map.begin();
    EXPECT_EQ((*it).first, a);
    EXPECT_EQ((*it).second, "a");
    EXPECT_TRUE(it == map.cbegin());

    Map::const_iterator end = map.end();
    EXPECT_TRUE(end == map.cend());
    EXPECT_EQ(std::distance(it, end), 2);
}

TEST_F(LeaseMapTest, DrainHandsValuesBack) {
    SlotKey a = map.insert("a");
    SlotKey b = map.insert("b");
    SlotKey c = map.insert("c");
    SlotKey d = map.insert("d");
    SlotKey e = map.insert("e");
    map.remove(b);
    map.remove(d);

    std::vector<std::pair<SlotKey, std::string>> drained;
    for (auto& entry : map.drain()) {
        drained.push_back(std::move(entry));
    }

    EXPECT_THAT(drained, ElementsAre(Pair(a, "a"), Pair(c, "c"), Pair(e, "e")));
    EXPECT_EQ(map.len(), 0u);
    EXPECT_EQ(map.capacity(), 5u);
}

TEST_F(LeaseMapTest, RemoveIfSeesValues) {
    map.insert("keep");
    SlotKey drop = map.insert("drop");
    EXPECT_EQ(map.remove_if([](SlotKey, const std::string& v) { return v == "drop"; }), 1u);
    EXPECT_FALSE(map.contains_key(drop));
    EXPECT_EQ(map.len(), 1u);
}

TEST_F(LeaseMapTest, ClearKeepsCapacity) {
    SlotKey k = map.insert("a");
    map.insert("b");
    map.clear();
    EXPECT_TRUE(map.is_empty());
    EXPECT_EQ(map.capacity(), 2u);
    EXPECT_FALSE(map.contains_key(k));
    EXPECT_THAT(map.free_indices(), ElementsAre(0u, 1u));
}

TEST_F(LeaseMapTest, ConfiguredLimitThrows) {
    Map small(Map::Config(0, 1));
    SlotKey k = small.insert("only");
    EXPECT_THROW(small.insert("extra"), CapacityExceeded);
    EXPECT_EQ(small.len(), 1u);
    EXPECT_EQ(small.max_slots(), 1u);

    small.remove(k);
    EXPECT_NO_THROW(small.insert("extra"));
}

TEST_F(LeaseMapTest, DefaultClockWorks) {
    LeaseMap<int> real;
    SlotKey k = real.insert(42);
    EXPECT_EQ(*real.get(k), 42);
    EXPECT_EQ(real.evict_older_than(std::chrono::hours(1)), 0u);
    std::optional<std::chrono::steady_clock::duration> age = real.lease_age(k);
    ASSERT_TRUE(age.has_value());
    EXPECT_GE(age->count(), 0);
}
