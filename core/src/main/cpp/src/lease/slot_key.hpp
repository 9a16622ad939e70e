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
#include <functional>
#include <iosfwd>
#include <string>

namespace leasemap {

    /**
     * SlotKey identifies one tenancy of a slot in a SlotTable.
     *
     * It packs the slot index and the slot's generation at the time the key
     * was issued. Once the slot is vacated its generation moves on, so every
     * key issued for the earlier tenancy stops resolving, even after the
     * index has been handed out again.
     *
     * Layout: [63:32] slot index, [31:0] generation
     */
    class alignas(8) SlotKey {
    public:
        static constexpr uint64_t INVALID_RAW = ~uint64_t{0};

        // Trivial so keys can be copied into plain arrays and hashed by value
        SlotKey() = default;
        ~SlotKey() = default;
        SlotKey(const SlotKey&) = default;
        SlotKey& operator=(const SlotKey&) = default;

        static constexpr SlotKey from_raw(uint64_t v) {
            SlotKey k{};
            k.v_ = v;
            return k;
        }

        static constexpr SlotKey invalid() {
            return from_raw(INVALID_RAW);
        }

        static constexpr SlotKey from_parts(uint32_t index, uint32_t generation) {
            return from_raw((uint64_t(index) << 32) | generation);
        }

        constexpr uint64_t raw() const {
            return v_;
        }

        constexpr uint32_t index() const {
            return uint32_t(v_ >> 32);
        }

        constexpr uint32_t generation() const {
            return uint32_t(v_ & 0xFFFFFFFFu);
        }

        /**
         * False only for SlotKey::invalid(). A valid-looking key may still
         * be stale; only the table can tell.
         */
        constexpr bool valid() const {
            return v_ != INVALID_RAW;
        }

        constexpr bool operator==(const SlotKey& o) const { return v_ == o.v_; }
        constexpr bool operator!=(const SlotKey& o) const { return v_ != o.v_; }
        constexpr bool operator<(const SlotKey& o) const  { return v_ < o.v_; }

        std::string to_string() const;

    private:
        uint64_t v_;  // No default member initializer to keep trivial
    }; // SlotKey

    static_assert(alignof(SlotKey) == 8, "SlotKey must be 8-byte aligned");
    static_assert(sizeof(SlotKey) == 8, "SlotKey must be exactly 8 bytes");

    std::ostream& operator<<(std::ostream& os, const SlotKey& key);

} // namespace leasemap

namespace std {
    template<>
    struct hash<leasemap::SlotKey> {
        size_t operator()(const leasemap::SlotKey& k) const noexcept {
            return std::hash<uint64_t>()(k.raw());
        }
    };
}
