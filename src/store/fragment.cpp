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

#include "fragment.h"
#include "store_error.h"
#include <algorithm>
#include <cstring>
#include <string>

namespace flashkv {
namespace store {
namespace fragment {

void check_range(const KeyRange& range) {
    if (range.start >= range.end) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "empty key range [" + std::to_string(range.start) + ", " +
                         std::to_string(range.end) + ")");
    }
    if (range.end > limits::kMaxKey + 1u) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "key range ends past " + std::to_string(limits::kMaxKey));
    }
}

size_t chunks_needed(const Store& store, size_t length) {
    const size_t chunk = store.max_value_length();
    return std::max<size_t>(1, (length + chunk - 1) / chunk);
}

void write(Store& store, const KeyRange& range, const std::vector<uint8_t>& value) {
    check_range(range);
    const size_t chunk = store.max_value_length();
    const size_t count = chunks_needed(store, value.size());
    if (count > range.size()) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "value of " + std::to_string(value.size()) + " bytes needs " +
                         std::to_string(count) + " keys, range has " + std::to_string(range.size()));
    }

    std::vector<Operation> ops;
    ops.reserve(range.size());
    for (size_t i = 0; i < range.size(); i++) {
        const uint16_t key = static_cast<uint16_t>(range.start + i);
        if (i < count) {
            const size_t begin = i * chunk;
            const size_t end = std::min(value.size(), begin + chunk);
            ops.push_back(Operation::insert(
                key, std::vector<uint8_t>(value.begin() + begin, value.begin() + end)));
        } else {
            ops.push_back(Operation::remove(key));
        }
    }
    store.transaction(ops);
}

std::optional<std::vector<uint8_t>> read(Store& store, const KeyRange& range) {
    check_range(range);
    std::optional<std::vector<uint8_t>> out;
    for (uint16_t key = range.start; key < range.end; key++) {
        std::optional<std::vector<uint8_t>> part = store.find(key);
        if (!part) {
            break;
        }
        if (!out) {
            out.emplace();
        }
        out->insert(out->end(), part->begin(), part->end());
    }
    return out;
}

void remove(Store& store, const KeyRange& range) {
    check_range(range);
    std::vector<Operation> ops;
    ops.reserve(range.size());
    for (uint16_t key = range.start; key < range.end; key++) {
        ops.push_back(Operation::remove(key));
    }
    store.transaction(ops);
}

FragmentWriter::FragmentWriter(Store& store, const KeyRange& range)
    : store_(store), range_(range) {
    check_range(range_);
}

void FragmentWriter::write(const uint8_t* data, size_t length) {
    if (chunks_needed(store_, buffer_.size() + length) > range_.size()) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "value would exceed " + std::to_string(range_.size()) + " keys");
    }
    buffer_.insert(buffer_.end(), data, data + length);
}

void FragmentWriter::commit() {
    fragment::write(store_, range_, buffer_);
}

FragmentReader::FragmentReader(Store& store, const KeyRange& range)
    : value_(fragment::read(store, range)) {}

void FragmentReader::seek(size_t position) {
    if (position > size()) {
        throw StoreError(StoreErrorCode::OutOfBounds,
                         "seek to " + std::to_string(position) + " past " + std::to_string(size()));
    }
    position_ = position;
}

size_t FragmentReader::read(uint8_t* out, size_t length) {
    const size_t count = std::min(length, size() - position_);
    if (count > 0) {
        std::memcpy(out, value_->data() + position_, count);
        position_ += count;
    }
    return count;
}

} // namespace fragment
} // namespace store
} // namespace flashkv
