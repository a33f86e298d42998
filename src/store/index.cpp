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

#include "index.h"
#include <algorithm>

namespace flashkv {
namespace store {

void Index::insert(uint16_t key, const Location& location) {
    auto it = map_.find(key);
    if (it != map_.end()) {
        live_bytes_ -= it->second.size;
        it->second = location;
    } else {
        map_.emplace(key, location);
    }
    live_bytes_ += location.size;
}

bool Index::remove(uint16_t key) {
    auto it = map_.find(key);
    if (it == map_.end()) {
        return false;
    }
    live_bytes_ -= it->second.size;
    map_.erase(it);
    return true;
}

const Location* Index::find(uint16_t key) const {
    auto it = map_.find(key);
    return it == map_.end() ? nullptr : &it->second;
}

void Index::clear() {
    map_.clear();
    live_bytes_ = 0;
}

std::vector<uint16_t> Index::keys() const {
    std::vector<uint16_t> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) {
        out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::pair<uint16_t, Location>> Index::on_page(size_t page) const {
    std::vector<std::pair<uint16_t, Location>> out;
    for (const auto& kv : map_) {
        if (kv.second.page == page) {
            out.push_back(kv);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.second.offset < b.second.offset; });
    return out;
}

} // namespace store
} // namespace flashkv
