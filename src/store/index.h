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
#include <unordered_map>
#include <utility>
#include <vector>

namespace flashkv {
namespace store {

// Where the newest live copy of a key sits on flash
struct Location {
    size_t page = 0;
    size_t offset = 0;   // first byte of the entry within the page
    size_t length = 0;   // value bytes
    size_t size = 0;     // encoded bytes, padding included

    bool operator==(const Location& other) const {
        return page == other.page && offset == other.offset &&
               length == other.length && size == other.size;
    }
};

/**
 * In-memory map from key to the location of its live entry.
 * Rebuilt by recovery at open; never persisted.
 */
class Index {
public:
    using Map = std::unordered_map<uint16_t, Location>;

    void insert(uint16_t key, const Location& location);
    bool remove(uint16_t key);
    const Location* find(uint16_t key) const;
    bool contains(uint16_t key) const { return map_.count(key) != 0; }

    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }
    void clear();

    // Sum of encoded sizes of every live entry
    size_t live_bytes() const { return live_bytes_; }

    // Keys ascending
    std::vector<uint16_t> keys() const;

    // Live entries on one page ordered by offset
    std::vector<std::pair<uint16_t, Location>> on_page(size_t page) const;

    Map::const_iterator begin() const { return map_.begin(); }
    Map::const_iterator end() const { return map_.end(); }

private:
    Map map_;
    size_t live_bytes_ = 0;
};

} // namespace store
} // namespace flashkv
