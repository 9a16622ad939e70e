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

#pragma once
#include <cstdint>
#include <cstddef>
#include "../config.h"

namespace leasemap {

// Slot table configuration
namespace slot_table {
    // Vacant link value meaning "no further free slot"
    constexpr uint32_t kEndOfList = 0xFFFFFFFFu;

    // Largest table length; every index must stay below kEndOfList
    constexpr uint64_t kMaxSlots = LEASEMAP_MAX_SLOTS;
    static_assert(kMaxSlots < kEndOfList, "LEASEMAP_MAX_SLOTS must leave room for the end-of-list sentinel");

    constexpr size_t kDefaultCapacity = LEASEMAP_DEFAULT_CAPACITY;

    // For runtime configuration via environment
    constexpr const char* kInitialCapacityEnvVar = "LEASEMAP_INITIAL_CAPACITY";
    constexpr const char* kMaxSlotsEnvVar = "LEASEMAP_MAX_SLOTS";
}

// Age-based eviction
namespace eviction {
    // Sweeps that evict at least this many entries are logged at INFO
    constexpr size_t kLogThreshold = LEASEMAP_EVICT_LOG_THRESHOLD;
}

/**
 * Construction parameters for SlotTable and LeaseMap.
 *
 * initial_capacity slots are created Vacant up front. max_slots caps the
 * table length; inserting beyond it throws CapacityExceeded. A max_slots
 * of 0 means the whole index domain (kMaxSlots).
 */
struct SlotTableConfig {
    size_t initial_capacity;
    size_t max_slots;

    SlotTableConfig()
        : initial_capacity(slot_table::kDefaultCapacity)
        , max_slots(static_cast<size_t>(slot_table::kMaxSlots)) {}

    SlotTableConfig(size_t initial, size_t max)
        : initial_capacity(initial), max_slots(max) {}

    /**
     * Defaults overridden by LEASEMAP_INITIAL_CAPACITY and LEASEMAP_MAX_SLOTS.
     * Unparsable or out-of-range values are logged and ignored.
     */
    static SlotTableConfig from_env();

    /**
     * Map max_slots of 0 or above kMaxSlots to kMaxSlots, and clamp
     * initial_capacity to max_slots.
     */
    SlotTableConfig normalized() const;
};

} // namespace leasemap
