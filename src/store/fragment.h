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
#include <optional>
#include <vector>
#include "store.h"

namespace flashkv {
namespace store {
namespace fragment {

/*
 * Values longer than max_value_length() stored as chunks under consecutive
 * keys of a range [start, end). The range packs into a u32 with start in the
 * low 16 bits and end in the high 16 bits.
 */
struct KeyRange {
    uint16_t start = 0;
    uint16_t end = 0;

    static KeyRange unpack(uint32_t packed) {
        return KeyRange{static_cast<uint16_t>(packed & 0xFFFF), static_cast<uint16_t>(packed >> 16)};
    }
    uint32_t pack() const { return (static_cast<uint32_t>(end) << 16) | start; }
    size_t size() const { return end > start ? end - start : 0; }
};

// Throws InvalidArgument for an empty range or one past the last key
void check_range(const KeyRange& range);

// Keys needed to hold a value of this length
size_t chunks_needed(const Store& store, size_t length);

// Stores the value over the first keys of the range and removes the rest of
// the range, in one transaction
void write(Store& store, const KeyRange& range, const std::vector<uint8_t>& value);

// Concatenation of the present keys from the start of the range up to the
// first absent one; nullopt when the first key is absent
std::optional<std::vector<uint8_t>> read(Store& store, const KeyRange& range);

// Removes every key of the range in one transaction
void remove(Store& store, const KeyRange& range);

// Accumulates a value and stores it on commit()
class FragmentWriter {
public:
    FragmentWriter(Store& store, const KeyRange& range);

    void write(const uint8_t* data, size_t length);
    void write(const std::vector<uint8_t>& data) { write(data.data(), data.size()); }

    // Bytes written so far
    size_t position() const { return buffer_.size(); }

    void commit();

private:
    Store& store_;
    KeyRange range_;
    std::vector<uint8_t> buffer_;
};

// Reads a stored value sequentially
class FragmentReader {
public:
    FragmentReader(Store& store, const KeyRange& range);

    bool found() const { return value_.has_value(); }
    size_t size() const { return value_ ? value_->size() : 0; }
    size_t position() const { return position_; }
    void seek(size_t position);

    // Copies up to length bytes from the cursor; returns the count copied
    size_t read(uint8_t* out, size_t length);

private:
    std::optional<std::vector<uint8_t>> value_;
    size_t position_ = 0;
};

} // namespace fragment
} // namespace store
} // namespace flashkv
