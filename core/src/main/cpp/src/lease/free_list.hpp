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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "config.h"

namespace leasemap {

    /**
     * Intrusive LIFO stack of vacant slot indices.
     *
     * The links live inside the Vacant slots themselves; the list only keeps
     * the head index and a count. The most recently vacated slot is always
     * the next one handed out.
     */
    template <typename SlotT>
    class FreeList {
    public:
        static constexpr uint32_t END = slot_table::kEndOfList;

        /**
         * Make slots[index] Vacant, linked to the current head, and make it
         * the new head. Any value still held by the slot is destroyed.
         */
        void push(std::vector<SlotT>& slots, uint32_t index) {
            slots[index].vacate(head_);
            head_ = index;
            ++size_;
        }

        /**
         * Unlink the head. Returns nullopt when the list is empty and the
         * table has to grow instead. The slot stays Vacant until filled.
         */
        std::optional<uint32_t> pop(const std::vector<SlotT>& slots) {
            if (head_ == END) {
                return std::nullopt;
            }
            uint32_t index = head_;
            head_ = slots[index].next_free();
            --size_;
            return index;
        }

        uint32_t head() const noexcept { return head_; }
        size_t size() const noexcept { return size_; }
        bool empty() const noexcept { return head_ == END; }

        /**
         * Visit every index reachable from the head, in chain order.
         * Stops after size() steps so a corrupted chain cannot loop forever.
         */
        template <typename Func>
        void walk(const std::vector<SlotT>& slots, Func&& fn) const {
            uint32_t cur = head_;
            for (size_t steps = 0; cur != END && steps <= size_; ++steps) {
                fn(cur);
                if (slots[cur].occupied()) {
                    return;
                }
                cur = slots[cur].next_free();
            }
        }

        void reset() noexcept {
            head_ = END;
            size_ = 0;
        }

    private:
        uint32_t head_ = END;
        size_t size_ = 0;
    };

} // namespace leasemap
