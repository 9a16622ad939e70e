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

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include "../src/lease/lease_map.hpp"
#include "../src/util/log_runtime.h"

using namespace leasemap;
using namespace std;

int main() {
    LogRuntime runtime;

    cout << "=== LeaseMap check-in / check-out example ===\n\n";

    // Honour LEASEMAP_INITIAL_CAPACITY / LEASEMAP_MAX_SLOTS when set
    LeaseMap<string> hotel(SlotTableConfig::from_env());

    SlotKey alice = hotel.insert("alice");
    SlotKey bob = hotel.insert("bob");
    cout << "alice -> " << alice << ", bob -> " << bob << "\n";

    hotel.remove(alice);
    SlotKey carol = hotel.insert("carol");
    cout << "alice checked out, carol -> " << carol << " (same room, new generation)\n";

    if (!hotel.get(alice)) {
        cout << "alice's old key no longer opens " << carol.index() << "\n";
    }

    this_thread::sleep_for(chrono::milliseconds(20));
    SlotKey dave = hotel.insert("dave");

    size_t evicted = hotel.evict_older_than(chrono::milliseconds(10));
    cout << "\nevicted " << evicted << " overstaying guests\n";

    cout << "\nguests still checked in:\n";
    for (auto [key, name] : hotel) {
        cout << "  " << key << " " << name << "\n";
    }
    cout << "dave still here: " << boolalpha << hotel.contains_key(dave) << "\n";

    LeaseMapStats stats = hotel.get_stats();
    cout << "\ninserts=" << stats.total_inserts
         << " removes=" << stats.total_removes
         << " reused=" << stats.reused_slots
         << " capacity=" << stats.capacity << "\n";

    for (auto& entry : hotel.drain()) {
        cout << "checking out " << entry.second << "\n";
    }
    cout << "empty: " << boolalpha << hotel.is_empty() << "\n";
    return 0;
}
