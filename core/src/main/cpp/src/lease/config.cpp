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

#include "config.h"
#include "../util/log.h"
#include <cerrno>
#include <cstdlib>

namespace leasemap {

    namespace {
        // Parses a decimal unsigned value; false on garbage or overflow
        bool parse_size(const char* text, size_t& out) {
            if (!text || !*text) return false;
            errno = 0;
            char* end = nullptr;
            unsigned long long v = std::strtoull(text, &end, 10);
            if (errno != 0 || end == text || *end != '\0' || text[0] == '-') {
                return false;
            }
            out = static_cast<size_t>(v);
            return true;
        }
    }

    SlotTableConfig SlotTableConfig::from_env() {
        SlotTableConfig config;

        const char* env_max = std::getenv(slot_table::kMaxSlotsEnvVar);
        if (env_max) {
            size_t max = 0;
            if (parse_size(env_max, max) && max >= 1 && max <= slot_table::kMaxSlots) {
                config.max_slots = max;
            } else {
                warning() << "Ignoring " << slot_table::kMaxSlotsEnvVar << "='" << env_max
                          << "': expected an integer in [1, " << slot_table::kMaxSlots << "]";
            }
        }

        const char* env_initial = std::getenv(slot_table::kInitialCapacityEnvVar);
        if (env_initial) {
            size_t initial = 0;
            if (parse_size(env_initial, initial) && initial <= config.max_slots) {
                config.initial_capacity = initial;
            } else {
                warning() << "Ignoring " << slot_table::kInitialCapacityEnvVar << "='" << env_initial
                          << "': expected an integer in [0, " << config.max_slots << "]";
            }
        }

        debug() << "SlotTableConfig from environment: initial_capacity=" << config.initial_capacity
                << " max_slots=" << config.max_slots;
        return config;
    }

    SlotTableConfig SlotTableConfig::normalized() const {
        SlotTableConfig c(*this);
        if (c.max_slots == 0 || c.max_slots > slot_table::kMaxSlots) {
            c.max_slots = static_cast<size_t>(slot_table::kMaxSlots);
        }
        if (c.initial_capacity > c.max_slots) {
            c.initial_capacity = c.max_slots;
        }
        return c;
    }

} // namespace leasemap
