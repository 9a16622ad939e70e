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
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include "lease/slot_table.hpp"

using namespace std::chrono;
using namespace leasemap;

class SlotTableChurnBenchmark : public ::testing::Test {
protected:
    void printSeparator(const std::string& title) {
        std::cout << "\n" << std::string(70, '=') << "\n";
        std::cout << "  " << title << "\n";
        std::cout << std::string(70, '=') << "\n";
    }

    static double nsPerOp(nanoseconds d, size_t ops) {
        return d.count() / double(ops);
    }
};

TEST_F(SlotTableChurnBenchmark, CheckInCheckOutVersusUnorderedMap) {
    printSeparator("Check-in / check-out churn at steady occupancy");

    const size_t OCCUPANCY[] = {64, 1024, 65536};
    const size_t ROUNDS = 1000000;

    std::cout << "\nLive entries | SlotTable ns/op | unordered_map ns/op | Speedup\n";
    std::cout << "-------------|-----------------|---------------------|--------\n";

    for (size_t live : OCCUPANCY) {
        std::mt19937 rng(42);
        std::uniform_int_distribution<size_t> pick(0, live - 1);

        SlotTable<uint64_t> table;
        std::vector<SlotKey> keys;
        keys.reserve(live);
        for (size_t i = 0; i < live; ++i) keys.push_back(table.insert(i));

        auto start = high_resolution_clock::now();
        for (size_t r = 0; r < ROUNDS; ++r) {
            size_t victim = pick(rng);
            std::optional<uint64_t> v = table.remove(keys[victim]);
            keys[victim] = table.insert(*v + 1);
        }
        auto slot_time = duration_cast<nanoseconds>(high_resolution_clock::now() - start);

        rng.seed(42);
        std::unordered_map<uint64_t, uint64_t> map;
        std::vector<uint64_t> ids;
        ids.reserve(live);
        uint64_t next_id = 0;
        for (size_t i = 0; i < live; ++i) {
            map.emplace(next_id, i);
            ids.push_back(next_id++);
        }

        start = high_resolution_clock::now();
        for (size_t r = 0; r < ROUNDS; ++r) {
            size_t victim = pick(rng);
            auto it = map.find(ids[victim]);
            uint64_t v = it->second;
            map.erase(it);
            map.emplace(next_id, v + 1);
            ids[victim] = next_id++;
        }
        auto map_time = duration_cast<nanoseconds>(high_resolution_clock::now() - start);

        double slot_ns = nsPerOp(slot_time, ROUNDS);
        double map_ns = nsPerOp(map_time, ROUNDS);
        std::cout << std::setw(12) << live << " | "
                  << std::setw(15) << std::fixed << std::setprecision(1) << slot_ns << " | "
                  << std::setw(19) << map_ns << " | "
                  << std::setw(6) << std::setprecision(2) << (map_ns / slot_ns) << "x\n";

        // steady-state churn must never grow the table
        EXPECT_EQ(table.capacity(), live);
        EXPECT_EQ(table.len(), live);
    }
}

TEST_F(SlotTableChurnBenchmark, LookupThroughput) {
    printSeparator("Generation-checked lookup");

    const size_t COUNT = 100000;
    SlotTable<uint64_t> table;
    std::vector<SlotKey> keys;
    keys.reserve(COUNT);
    for (size_t i = 0; i < COUNT; ++i) keys.push_back(table.insert(i));

    uint64_t sum = 0;
    auto start = high_resolution_clock::now();
    for (int pass = 0; pass < 10; ++pass) {
        for (SlotKey k : keys) {
            sum += *table.get(k);
        }
    }
    auto elapsed = duration_cast<nanoseconds>(high_resolution_clock::now() - start);

    std::cout << "\n" << COUNT * 10 << " lookups: " << std::fixed << std::setprecision(2)
              << nsPerOp(elapsed, COUNT * 10) << " ns/lookup\n";
    EXPECT_EQ(sum, uint64_t(10) * (COUNT * (COUNT - 1) / 2));
}
