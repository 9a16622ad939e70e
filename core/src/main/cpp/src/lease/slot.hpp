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
#include <utility>
#include <variant>
#include "config.h"

namespace leasemap {

    /**
     * Slot State Machine:
     *
     * VACANT(g):    state holds Vacant{next}, next links the free list
     * OCCUPIED(g):  state holds the value; keys carrying generation g resolve
     * VACANT(g+1):  after removal; every key carrying g is now stale
     *
     * Slots are never erased from the table, only toggled between states.
     */
    template <typename T>
    struct Slot {
        struct Vacant {
            uint32_t next;
        };

        std::variant<Vacant, T> state;
        uint32_t generation;

        Slot() : state(std::in_place_index<0>, Vacant{slot_table::kEndOfList}), generation(0) {}

        bool occupied() const noexcept { return state.index() == 1; }

        T& value() { return std::get<1>(state); }
        const T& value() const { return std::get<1>(state); }

        uint32_t next_free() const { return std::get<0>(state).next; }

        void vacate(uint32_t next) {
            state.template emplace<0>(Vacant{next});
        }

        template <typename... Args>
        T& occupy(Args&&... args) {
            return state.template emplace<1>(std::forward<Args>(args)...);
        }
    };

} // namespace leasemap
