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
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "config.h"
#include "free_list.hpp"
#include "slot.hpp"
#include "slot_key.hpp"
#include "../util/log.h"

namespace leasemap {

    /**
     * Thrown when a table of max_slots slots has no vacant slot left.
     * The table is unchanged when this is thrown.
     */
    class CapacityExceeded : public std::runtime_error {
    public:
        explicit CapacityExceeded(size_t max_slots)
            : std::runtime_error("SlotTable: cannot allocate slot - table is full (max_slots=" +
                                 std::to_string(max_slots) + ")"),
              max_slots_(max_slots) {}

        size_t max_slots() const noexcept { return max_slots_; }

    private:
        size_t max_slots_;
    };

    /**
     * Statistics for monitoring and tuning
     */
    struct SlotTableStats {
        size_t total_inserts = 0;
        size_t total_removes = 0;
        size_t reused_slots = 0;     // Inserts served from the free list
        size_t appended_slots = 0;   // Slots created by growth (including pre-reserved ones)
        size_t free_slots = 0;       // Current free list length
        size_t capacity = 0;         // Current table length
    };

    /**
     * Input iterator over any drain source exposing
     * std::optional<value_type> next(). Each increment pulls (and removes)
     * one more entry.
     */
    template <typename Source>
    class DrainIterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename Source::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = value_type*;
        using reference = value_type&;

        DrainIterator() : source_(nullptr) {}
        explicit DrainIterator(Source* source) : source_(source) { pull(); }

        reference operator*() { return *current_; }
        pointer operator->() { return &*current_; }

        DrainIterator& operator++() {
            pull();
            return *this;
        }

        // Only exhausted iterators compare equal; enough for loops against end()
        bool operator==(const DrainIterator& o) const { return !current_ && !o.current_; }
        bool operator!=(const DrainIterator& o) const { return !(*this == o); }

    private:
        void pull() {
            std::optional<value_type> n = source_->next();
            current_.reset();
            if (n) {
                current_.emplace(std::move(*n));
            }
        }

        Source* source_;
        std::optional<value_type> current_;
    };

    /**
     * Dense table of slots keyed by generation-checked SlotKeys.
     *
     * insert pops the most recently vacated slot from the intrusive free
     * list, or appends a new slot when none is free. remove vacates the slot,
     * bumps its generation and pushes it back on the free list. Lookups index
     * directly and compare generations, so stale keys resolve to nothing.
     *
     * Not thread-safe; callers sharing a table must lock around it.
     * Pointers returned by get/get_mut are invalidated by any insert that
     * grows the table.
     */
    template <typename T>
    class SlotTable {
    public:
        using value_type = T;
        using SlotType = Slot<T>;

        SlotTable() : max_slots_(static_cast<size_t>(slot_table::kMaxSlots)) {}

        explicit SlotTable(const SlotTableConfig& config)
            : max_slots_(config.normalized().max_slots) {
            append_vacant(config.normalized().initial_capacity);
        }

        SlotTable(const SlotTable&) = default;
        SlotTable& operator=(const SlotTable&) = default;

        SlotTable(SlotTable&& o) noexcept
            : slots_(std::move(o.slots_)), free_(o.free_), len_(o.len_),
              max_slots_(o.max_slots_), stats_(o.stats_) {
            o.reset_moved_from();
        }

        SlotTable& operator=(SlotTable&& o) noexcept {
            if (this != &o) {
                slots_ = std::move(o.slots_);
                free_ = o.free_;
                len_ = o.len_;
                max_slots_ = o.max_slots_;
                stats_ = o.stats_;
                o.reset_moved_from();
            }
            return *this;
        }

        SlotKey insert(const T& value) { return emplace(value); }
        SlotKey insert(T&& value) { return emplace(std::move(value)); }

        /**
         * Construct a value from args and move it into the next free slot.
         * args may refer to values already stored in this table.
         * @throws CapacityExceeded if no slot is vacant and the table is at max_slots
         */
        template <typename... Args>
        SlotKey emplace(Args&&... args) {
            // args may refer into slots_; build the value before growth can move them
            T value(std::forward<Args>(args)...);
            const uint32_t index = acquire_slot();
            SlotType& slot = slots_[index];
            try {
                slot.occupy(std::move(value));
            } catch (...) {
                // move constructor threw; hand the slot back untouched
                free_.push(slots_, index);
                throw;
            }
            ++len_;
            ++stats_.total_inserts;
            return SlotKey::from_parts(index, slot.generation);
        }

        /**
         * Take the value out of the slot named by key.
         * Stale, vacant or out-of-range keys return nullopt and change nothing.
         */
        std::optional<T> remove(SlotKey key) {
            SlotType* slot = find(key);
            if (!slot) {
                return std::nullopt;
            }
            std::optional<T> out(std::move(slot->value()));
            ++slot->generation;
            free_.push(slots_, key.index());
            --len_;
            ++stats_.total_removes;
            return out;
        }

        /**
         * Remove every entry for which pred(key, value) is true, visiting
         * indices in ascending order. Returns the number removed.
         */
        template <typename Pred>
        size_t remove_if(Pred&& pred) {
            size_t removed = 0;
            for (size_t i = 0; i < slots_.size(); ++i) {
                SlotType& slot = slots_[i];
                if (!slot.occupied()) {
                    continue;
                }
                const SlotKey key = SlotKey::from_parts(static_cast<uint32_t>(i), slot.generation);
                if (pred(key, static_cast<const T&>(slot.value()))) {
                    ++slot.generation;
                    free_.push(slots_, static_cast<uint32_t>(i));
                    --len_;
                    ++stats_.total_removes;
                    ++removed;
                }
            }
            return removed;
        }

        const T* get(SlotKey key) const {
            const SlotType* slot = find(key);
            return slot ? &slot->value() : nullptr;
        }

        T* get_mut(SlotKey key) {
            SlotType* slot = find(key);
            return slot ? &slot->value() : nullptr;
        }

        bool contains_key(SlotKey key) const {
            return find(key) != nullptr;
        }

        size_t len() const noexcept { return len_; }
        size_t capacity() const noexcept { return slots_.size(); }
        bool is_empty() const noexcept { return len_ == 0; }
        size_t max_slots() const noexcept { return max_slots_; }
        size_t free_count() const noexcept { return free_.size(); }

        /**
         * Reserve backing storage for n slots; capacity() is unchanged.
         */
        void reserve(size_t n) {
            if (n > max_slots_) {
                throw CapacityExceeded(max_slots_);
            }
            slots_.reserve(n);
        }

        /**
         * Vacate every slot. Occupied slots get a new generation; the free
         * list is rebuilt so the lowest index is handed out first.
         */
        void clear() {
            free_.reset();
            for (size_t i = slots_.size(); i-- > 0;) {
                if (slots_[i].occupied()) {
                    ++slots_[i].generation;
                    ++stats_.total_removes;
                }
                free_.push(slots_, static_cast<uint32_t>(i));
            }
            len_ = 0;
        }

        /**
         * Indices reachable from the free list head, in chain order.
         */
        std::vector<uint32_t> free_indices() const {
            std::vector<uint32_t> out;
            out.reserve(free_.size());
            free_.walk(slots_, [&out](uint32_t index) { out.push_back(index); });
            return out;
        }

        SlotTableStats get_stats() const {
            SlotTableStats s = stats_;
            s.free_slots = free_.size();
            s.capacity = slots_.size();
            return s;
        }

        /**
         * Forward iterator over occupied slots in ascending index order.
         * Dereferences to (SlotKey, T&). Any insert or remove invalidates it.
         */
        template <bool Const>
        class basic_iterator {
            using table_ptr = typename std::conditional<Const, const SlotTable*, SlotTable*>::type;
            using value_ref = typename std::conditional<Const, const T&, T&>::type;
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = std::pair<SlotKey, value_ref>;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = value_type;

            basic_iterator() : table_(nullptr), pos_(0) {}
            basic_iterator(table_ptr table, size_t pos) : table_(table), pos_(pos) {
                skip_vacant();
            }

            // mutable -> const conversion
            template <bool C = Const, typename = typename std::enable_if<C>::type>
            basic_iterator(const basic_iterator<false>& o) : table_(o.table_), pos_(o.pos_) {}

            reference operator*() const {
                auto& slot = table_->slots_[pos_];
                return value_type(SlotKey::from_parts(static_cast<uint32_t>(pos_), slot.generation),
                                  slot.value());
            }

            basic_iterator& operator++() {
                ++pos_;
                skip_vacant();
                return *this;
            }

            basic_iterator operator++(int) {
                basic_iterator tmp(*this);
                ++(*this);
                return tmp;
            }

            bool operator==(const basic_iterator& o) const { return pos_ == o.pos_; }
            bool operator!=(const basic_iterator& o) const { return pos_ != o.pos_; }

        private:
            friend class basic_iterator<!Const>;

            void skip_vacant() {
                while (pos_ < table_->slots_.size() && !table_->slots_[pos_].occupied()) {
                    ++pos_;
                }
            }

            table_ptr table_;
            size_t pos_;
        };

        using iterator = basic_iterator<false>;
        using const_iterator = basic_iterator<true>;

        iterator begin() { return iterator(this, 0); }
        iterator end() { return iterator(this, slots_.size()); }
        const_iterator begin() const { return const_iterator(this, 0); }
        const_iterator end() const { return const_iterator(this, slots_.size()); }
        const_iterator cbegin() const { return begin(); }
        const_iterator cend() const { return end(); }

        /**
         * Range that removes entries as it yields them, in ascending index
         * order. Entries not consumed are removed when the drain is destroyed.
         */
        class Drain {
        public:
            using value_type = std::pair<SlotKey, T>;
            using iterator = DrainIterator<Drain>;

            explicit Drain(SlotTable& table) : table_(&table), pos_(0) {}

            ~Drain() {
                while (next()) {
                }
            }

            Drain(const Drain&) = delete;
            Drain& operator=(const Drain&) = delete;

            std::optional<value_type> next() {
                const auto& slots = table_->slots_;
                while (pos_ < slots.size() && !slots[pos_].occupied()) {
                    ++pos_;
                }
                if (pos_ >= slots.size()) {
                    return std::nullopt;
                }
                const uint32_t index = static_cast<uint32_t>(pos_++);
                const SlotKey key = SlotKey::from_parts(index, slots[index].generation);
                std::optional<T> value = table_->remove(key);
                return std::optional<value_type>(std::in_place, key, std::move(*value));
            }

            iterator begin() { return iterator(this); }
            iterator end() { return iterator(); }

        private:
            SlotTable* table_;
            size_t pos_;
        };

        Drain drain() { return Drain(*this); }

    private:
        const SlotType* find(SlotKey key) const {
            if (key.index() >= slots_.size()) {
                return nullptr;
            }
            const SlotType& slot = slots_[key.index()];
            if (!slot.occupied() || slot.generation != key.generation()) {
                return nullptr;
            }
            return &slot;
        }

        SlotType* find(SlotKey key) {
            return const_cast<SlotType*>(static_cast<const SlotTable*>(this)->find(key));
        }

        /**
         * Pop a vacant index, or append a slot when the free list is empty.
         */
        uint32_t acquire_slot() {
            if (std::optional<uint32_t> reused = free_.pop(slots_)) {
                ++stats_.reused_slots;
                return *reused;
            }

            if (slots_.size() >= max_slots_) {
                error() << "SlotTable: no vacant slot and table is full (capacity="
                        << slots_.size() << ", max_slots=" << max_slots_ << ")";
                throw CapacityExceeded(max_slots_);
            }

            const size_t old_storage = slots_.capacity();
            slots_.emplace_back();
            ++stats_.appended_slots;
            if (slots_.capacity() != old_storage) {
                trace() << "SlotTable: grew backing storage " << old_storage
                        << " -> " << slots_.capacity() << " slots";
            }
            return static_cast<uint32_t>(slots_.size() - 1);
        }

        // Append n vacant slots linked so the lowest index is popped first
        void append_vacant(size_t n) {
            if (n == 0) {
                return;
            }
            const size_t first = slots_.size();
            slots_.resize(first + n);
            for (size_t i = first + n; i-- > first;) {
                free_.push(slots_, static_cast<uint32_t>(i));
            }
            stats_.appended_slots += n;
            debug() << "SlotTable: pre-reserved " << n << " vacant slots";
        }

        void reset_moved_from() noexcept {
            slots_.clear();
            free_.reset();
            len_ = 0;
            stats_ = SlotTableStats();
        }

        std::vector<SlotType> slots_;
        FreeList<SlotType> free_;
        size_t len_ = 0;
        size_t max_slots_;
        SlotTableStats stats_{};
    }; // class SlotTable

} // namespace leasemap
