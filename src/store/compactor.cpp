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

#include "compactor.h"
#include "store_error.h"
#include "../util/log.h"
#include <string>
#include <utility>

namespace flashkv {
namespace store {

Compactor::Compactor(const Format& format, LogStore& log, Index& index,
                     StoreMetrics& metrics, const StoreConfig& config)
    : format_(format), log_(log), index_(index), metrics_(metrics), config_(config) {}

size_t Compactor::max_compactions() const {
    if (config_.max_compactions != 0) {
        return config_.max_compactions;
    }
    return compaction::kMaxRoundsPerPage * format_.num_pages();
}

void Compactor::ensure_room(const std::vector<size_t>& sizes) {
    const size_t limit = max_compactions();
    for (size_t round = 0; round < limit; round++) {
        if (log_.fits(sizes, false)) {
            return;
        }
        compact_once();
    }
    if (!log_.fits(sizes, false)) {
        throw StoreError(StoreErrorCode::NoSpaceLeft,
                         "no room after " + std::to_string(limit) + " compactions");
    }
}

void Compactor::compact_once() {
    if (log_.head() == log_.tail()) {
        // The head can only be erased once the tail has moved on
        log_.advance_page(true);
    }

    const size_t page = log_.head();
    log_.set_compacting(page);
    auto live = index_.on_page(page);

    std::vector<std::pair<uint16_t, Location>> moved;
    moved.reserve(live.size());
    for (const auto& kv : live) {
        const uint16_t key = kv.first;
        std::vector<uint8_t> bytes = log_.read(kv.second);
        Decoded d = format_.decode_entry(bytes.data(), bytes.size());
        if (d.status != DecodeStatus::Valid || d.entry.key != key ||
            d.entry.kind != EntryKind::Value || !d.entry.live) {
            throw StoreError(StoreErrorCode::StorageCorrupted,
                             "entry for key " + std::to_string(key) + " on page " +
                             std::to_string(page) + " offset " + std::to_string(kv.second.offset) +
                             " does not decode");
        }

        std::vector<uint8_t> encoded = format_.encode_entry(key, d.entry.value.data(),
                                                            d.entry.value.size(),
                                                            EntryKind::Value, Position::Standalone);
        Location to = log_.append(encoded, d.entry.value.size(), true);

        // The head page is only erased once every copy reads back intact
        std::vector<uint8_t> check = log_.read(to);
        Decoded v = format_.decode_entry(check.data(), check.size());
        if (v.status != DecodeStatus::Valid || v.entry.key != key ||
            v.entry.value != d.entry.value) {
            throw StoreError(StoreErrorCode::StorageError,
                             "relocation of key " + std::to_string(key) + " to page " +
                             std::to_string(to.page) + " did not verify");
        }
        moved.emplace_back(key, to);
    }

    try {
        log_.erase_head();
    } catch (const StoreError& e) {
        throw StoreError(StoreErrorCode::StorageCorrupted,
                         "erase of page " + std::to_string(page) + " failed: " + e.what());
    }

    for (const auto& kv : moved) {
        index_.insert(kv.first, kv.second);
    }
    metrics_.compactions.increment();
    debug() << "compactor: page " << page << " reclaimed, " << moved.size()
            << " entries relocated, head now " << log_.head();
}

} // namespace store
} // namespace flashkv
