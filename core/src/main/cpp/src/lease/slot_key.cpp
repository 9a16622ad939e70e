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

#include "slot_key.hpp"
#include <ostream>
#include <sstream>

namespace leasemap {

    std::string SlotKey::to_string() const {
        if (!valid()) {
            return "SlotKey(invalid)";
        }
        std::ostringstream oss;
        oss << "SlotKey(" << index() << "v" << generation() << ")";
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const SlotKey& key) {
        return os << key.to_string();
    }

} // namespace leasemap
