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

#include <chrono>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include "config.h"
#include "slot_key.hpp"
#include "slot_table.hpp"
#include "../util/log.h"

namespace leasemap {

    struct LeaseMapStats : public SlotTableStats {
        size_t total_evictions = 0;
        size_t eviction_sweeps = 0;
    };

    /**
     * Short-lease container: check a value in, get a room number (SlotKey)
     * back, check it out again with remove. A vacated room is the first one
     * handed to the next arrival, and the old key no longer opens it.
     *
     * Each entry remembers when it was checked in so guests that overstay
     * can be swept out with evict_older_than. Clock is any type with a
     * static now() returning Clock::time_point.
     */
    template <typename V, typename Clock = std::chrono::steady_clock>
    class LeaseMap {
    public:
        using clock_type = Clock;
        using time_point = typename Clock::time_point;
        using duration = typename Clock::duration;
        using Config = SlotTableConfig;

        struct Lease {
            V value;
            time_point since;

            template <typename... Args>
            explicit Lease(time_point t, Args&&... args)
                : value(std::forward<Args>(args)...), since(t) {}
        };

        using Table = SlotTable<Lease>;

        LeaseMap() = default;
        explicit LeaseMap(const Config& config) : table_(config) {}

        /**
         * Map with n vacant slots; inserts hand out indices 0..n-1 in order
         * before the table grows.
         */
        static LeaseMap with_capacity(size_t n) {
            return LeaseMap(Config(n, static_cast<size_t>(slot_table::kMaxSlots)));
        }

        SlotKey insert(const V& value) { return emplace(value); }
        SlotKey insert(V&& value) { return emplace(std::move(value)); }

        template <typename... Args>
        SlotKey emplace(Args&&... args) {
            return table_.emplace(Clock::now(), std::forward<Args>(args)...);
        }

        std::optional<V> remove(SlotKey key) {
            std::optional<Lease> lease = table_.remove(key);
            if (!lease) {
                return std::nullopt;
            }
            return std::optional<V>(std::move(lease->value));
        }

        const V* get(SlotKey key) const {
            const Lease* lease = table_.get(key);
            return lease ? &lease->value : nullptr;
        }

        V* get_mut(SlotKey key) {
            Lease* lease = table_.get_mut(key);
            return lease ? &lease->value : nullptr;
        }

        bool contains_key(SlotKey key) const { return table_.contains_key(key); }

        size_t len() const noexcept { return table_.len(); }
        size_t capacity() const noexcept { return table_.capacity(); }
        bool is_empty() const noexcept { return table_.is_empty(); }
        size_t max_slots() const noexcept { return table_.max_slots(); }

        void reserve(size_t n) { table_.reserve(n); }
        void clear() { table_.clear(); }

        /**
         * Time since the entry was checked in, nullopt for a stale key.
         */
        std::optional<duration> lease_age(SlotKey key) const {
            const Lease* lease = table_.get(key);
            if (!lease) {
                return std::nullopt;
            }
            return Clock::now() - lease->since;
        }

        template <typename Pred>
        size_t remove_if(Pred&& pred) {
            return table_.remove_if([&pred](SlotKey key, const Lease& lease) {
                return pred(key, lease.value);
            });
        }

        /**
         * Evict guests which have overstayed: every entry checked in more
         * than max_age ago is dropped and its key becomes stale.
         * Returns the number evicted.
         */
        size_t evict_older_than(duration max_age) {
            const time_point now = Clock::now();
            const size_t evicted = table_.remove_if([now, max_age](SlotKey, const Lease& lease) {
                return now - lease.since > max_age;
            });

            ++eviction_sweeps_;
            total_evictions_ += evicted;

            if (evicted >= eviction::kLogThreshold) {
                info() << "LeaseMap: evicted " << evicted << " expired entries, "
                       << table_.len() << " remain";
            } else {
                debug() << "LeaseMap: evicted " << evicted << " expired entries, "
                        << table_.len() << " remain";
            }
            return evicted;
        }

        LeaseMapStats get_stats() const {
            LeaseMapStats s;
            static_cast<SlotTableStats&>(s) = table_.get_stats();
            s.total_evictions = total_evictions_;
            s.eviction_sweeps = eviction_sweeps_;
            return s;
        }

        std::vector<uint32_t> free_indices() const { return table_.free_indices(); }

        /**
         * Iterates over (SlotKey, V&) in ascending index order.
         */
        template <bool Const>
        class basic_iterator {
            using inner_iterator = typename std::conditional<Const,
                typename Table::const_iterator, typename Table::iterator>::type;
            using value_ref = typename std::conditional<Const, const V&, V&>::type;
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = std::pair<SlotKey, value_ref>;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = value_type;

            basic_iterator() = default;
            explicit basic_iterator(inner_iterator it) : it_(it) {}

            // mutable -> const conversion
            template <bool C = Const, typename = typename std::enable_if<C>::type>
            basic_iterator(const basic_iterator<false>& o) : it_(o.it_) {}

            reference operator*() const {
                auto entry = *it_;
                return value_type(entry.first, entry.second.value);
            }

            basic_iterator& operator++() {
                ++it_;
                return *this;
            }

            basic_iterator operator++(int) {
                basic_iterator tmp(*this);
                ++it_;
                return tmp;
            }

            bool operator==(const basic_iterator& o) const { return it_ == o.it_; }
            bool operator!=(const basic_iterator& o) const { return it_ != o.it_; }

        private:
            friend class basic_iterator<!Const>;

            inner_iterator it_;
        };

        using iterator = basic_iterator<false>;
        using const_iterator = basic_iterator<true>;

        iterator begin() { return iterator(table_.begin()); }
        iterator end() { return iterator(table_.end()); }
        const_iterator begin() const { return const_iterator(table_.begin()); }
        const_iterator end() const { return const_iterator(table_.end()); }
        const_iterator cbegin() const { return begin(); }
        const_iterator cend() const { return end(); }

        /**
         * Removes entries as they are yielded; see SlotTable::Drain.
         */
        class Drain {
        public:
            using value_type = std::pair<SlotKey, V>;
            using iterator = DrainIterator<Drain>;

            explicit Drain(Table& table) : inner_(table) {}

            std::optional<value_type> next() {
                std::optional<typename Table::Drain::value_type> n = inner_.next();
                if (!n) {
                    return std::nullopt;
                }
                return std::optional<value_type>(std::in_place, n->first, std::move(n->second.value));
            }

            iterator begin() { return iterator(this); }
            iterator end() { return iterator(); }

        private:
            typename Table::Drain inner_;
        };

        Drain drain() { return Drain(table_); }

    private:
        Table table_;
        size_t total_evictions_ = 0;
        size_t eviction_sweeps_ = 0;
    }; // class LeaseMap

} // namespace leasemap
