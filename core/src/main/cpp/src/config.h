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

namespace leasemap {
#ifndef LEASEMAP_DEFAULT_CAPACITY
#define LEASEMAP_DEFAULT_CAPACITY 0
#endif

// upper bound on slots per table; the index domain is 32 bits with
// 0xFFFFFFFF reserved as the end-of-free-list sentinel
#ifndef LEASEMAP_MAX_SLOTS
#define LEASEMAP_MAX_SLOTS 0xFFFFFFFEull
#endif

#ifndef LEASEMAP_EVICT_LOG_THRESHOLD
#define LEASEMAP_EVICT_LOG_THRESHOLD 1024
#endif

}
