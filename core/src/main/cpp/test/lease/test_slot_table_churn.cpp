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
#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <vector>
#include "lease/slot_table.hpp"

using namespace leasemap;
using ::testing::UnorderedElementsAreArray;

/**
 * Randomized insert/remove churn checked against a std::map model after
 * every step: contents, key validity, LIFO reuse and free list shape.
 */
class SlotTableChurnTest : public ::testing::Test {
protected:
    SlotTable<int> table;
    std::map<SlotKey, int> model;
    std::vector<SlotKey> retired;
    std::mt19937 rng{12345};

    void check_invariants() {
        ASSERT_EQ(table.len(), model.size());
        ASSERT_EQ(table.len() + table.free_count(), table.capacity());

        for (const auto& kv : model) {
            const int* v = table.get(kv.first);
            ASSERT_NE(v, nullptr) << kv.first;
            ASSERT_EQ(*v, kv.second);
        }
        for (SlotKey k : retired) {
            ASSERT_FALSE(table.contains_key(k)) << "stale key resolved: " << k;
        }

        std::vector<uint32_t> chain = table.free_indices();
        std::set<uint32_t> chain_set(chain.begin(), chain.end());
        ASSERT_EQ(chain_set.size(), chain.size()) << "free list visits an index twice";

        std::set<uint32_t> occupied;
        for (const auto& kv : model) occupied.insert(kv.first.index());
        for (uint32_t i = 0; i < table.capacity(); ++i) {
            ASSERT_NE(chain_set.count(i) == 1, occupied.count(i) == 1) << "slot " << i;
        }
    }
};

TEST_F(SlotTableChurnTest, RandomOperationsPreserveInvariants) {
    std::uniform_int_distribution<int> op(0, 99);
    int next_value = 0;
    uint32_t last_freed = slot_table::kEndOfList;

    for (int step = 0; step < 5000; ++step) {
        bool do_insert = model.empty() || op(rng) < 55;
        if (do_insert) {
            SlotKey k = table.insert(next_value);
            if (last_freed != slot_table::kEndOfList) {
                // most recently vacated room goes to the next arrival
                ASSERT_EQ(k.index(), last_freed);
            }
            last_freed = slot_table::kEndOfList;
            model.emplace(k, next_value++);
        } else {
            auto it = model.begin();
            std::advance(it, std::uniform_int_distribution<size_t>(0, model.size() - 1)(rng));
            SlotKey k = it->first;
            std::optional<int> v = table.remove(k);
            ASSERT_TRUE(v.has_value());
            ASSERT_EQ(*v, it->second);
            model.erase(it);
            retired.push_back(k);
            last_freed = k.index();
        }
        if (step % 50 == 0) {
            check_invariants();
        }
    }
    check_invariants();

    std::vector<std::pair<SlotKey, int>> expected(model.begin(), model.end());
    std::vector<std::pair<SlotKey, int>> actual;
    for (auto entry : table) actual.emplace_back(entry.first, entry.second);
    EXPECT_THAT(actual, UnorderedElementsAreArray(expected));
    EXPECT_TRUE(std::is_sorted(actual.begin(), actual.end(),
        [](const std::pair<SlotKey, int>& a, const std::pair<SlotKey, int>& b) {
            return a.first.index() < b.first.index();
        }));
}

TEST_F(SlotTableChurnTest, SteadyStateChurnDoesNotGrow) {
    std::vector<SlotKey> live;
    for (int i = 0; i < 64; ++i) live.push_back(table.insert(i));
    const size_t cap = table.capacity();

    for (int round = 0; round < 10000; ++round) {
        size_t victim = std::uniform_int_distribution<size_t>(0, live.size() - 1)(rng);
        ASSERT_TRUE(table.remove(live[victim]).has_value());
        live[victim] = table.insert(round);
    }
    EXPECT_EQ(table.capacity(), cap);
    EXPECT_EQ(table.len(), 64u);
    EXPECT_EQ(table.get_stats().reused_slots, 10000u);
}

TEST_F(SlotTableChurnTest, DrainAfterChurnLeavesOnlyVacantSlots) {
    for (int i = 0; i < 200; ++i) {
        SlotKey k = table.insert(i);
        model.emplace(k, i);
        if (i % 3 == 0) {
            table.remove(k);
            model.erase(k);
            retired.push_back(k);
        }
    }
    check_invariants();
    const size_t cap = table.capacity();

    size_t drained = 0;
    uint32_t prev = 0;
    for (auto& entry : table.drain()) {
        if (drained > 0) {
            EXPECT_GT(entry.first.index(), prev);
        }
        prev = entry.first.index();
        EXPECT_EQ(model.at(entry.first), entry.second);
        retired.push_back(entry.first);
        ++drained;
    }
    model.clear();

    EXPECT_EQ(drained, 133u);
    EXPECT_EQ(table.capacity(), cap);
    check_invariants();
}
