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
#include "config.h"
#include "storage.h"

namespace flashkv {
namespace store {

/*
 * On-flash layout.
 *
 * Page:     [page header, padded to a word][entries ...][erased ...]
 * Header:   magic u16 | version u8 | flags u8 | sequence u32 | crc32c u32
 * Entry:    one or more fragments, never crossing a page boundary
 * Fragment: [header word u32][payload][pad to word]
 *           the last fragment also carries crc32c of the whole entry at the
 *           next 4-byte boundary after its payload
 *
 * Fragment header word (little endian):
 *   bits  0-11 key            bits 22-25 remaining fragments
 *   bits 12-19 payload length bit  26    kind (1 = tombstone)
 *   bits 20-21 reserved (1)   bits 27-28 position in transaction
 *   bit   29   reserved (1)   bit   30   live (cleared = deleted in place)
 *   bit   31   present (0)
 *
 * A word with every bit cleared is padding: a torn tail neutralized by
 * recovery. It is skipped one word at a time.
 */

enum class EntryKind : uint8_t {
    Value = 0,
    Tombstone = 1
};

enum class Position : uint8_t {
    Standalone = 0,
    Begin = 1,
    Continue = 2,
    End = 3
};

const char* to_string(Position position);

struct FragmentHeader {
    uint16_t  key = 0;
    uint8_t   length = 0;
    uint8_t   remaining = 0;
    EntryKind kind = EntryKind::Value;
    Position  position = Position::Standalone;
    bool      live = true;

    static constexpr uint32_t kLiveBit     = 1u << 30;
    static constexpr uint32_t kPresentBit  = 1u << 31;
    static constexpr uint32_t kReservedMask = (3u << 20) | (1u << 29);

    uint32_t pack() const;

    // nullopt when the word cannot be a fragment header
    static std::optional<FragmentHeader> unpack(uint32_t word);
};

// Driver geometry captured at open
struct Geometry {
    size_t word_size = 0;
    size_t page_size = 0;
    size_t num_pages = 0;
    size_t max_word_writes = 0;
    size_t max_page_erases = 0;

    static Geometry of(const Storage& storage);
};

struct Entry {
    uint16_t  key = 0;
    EntryKind kind = EntryKind::Value;
    Position  position = Position::Standalone;
    bool      live = true;
    std::vector<uint8_t> value;
};

enum class DecodeStatus {
    Valid,     // checksum verified
    Erased,    // first word erased: nothing was written here
    Padding,   // neutralized word, skip it
    Invalid    // torn or corrupt
};

struct Decoded {
    DecodeStatus status = DecodeStatus::Invalid;
    Entry entry;
    // Valid: bytes occupied. Padding: one word. Invalid: bytes examined
    // before the failure; every word past them belongs to something else.
    size_t extent = 0;
};

/**
 * Stateless encoder/decoder bound to one geometry.
 * The constructor validates the geometry and throws InvalidArgument.
 */
class Format {
public:
    explicit Format(const Geometry& geometry,
                    size_t max_value_length = limits::kMaxValueLength);

    const Geometry& geometry() const { return geometry_; }
    size_t word_size() const { return geometry_.word_size; }
    size_t page_size() const { return geometry_.page_size; }
    size_t num_pages() const { return geometry_.num_pages; }

    size_t page_header_size() const { return page_header_size_; }
    size_t page_capacity() const { return geometry_.page_size - page_header_size_; }
    size_t max_value_length() const { return max_value_length_; }

    // Bytes an entry with a value of this length occupies on flash
    size_t entry_size(size_t value_length) const;
    size_t fragment_count(size_t value_length) const;

    // Bytes available to live entries, one page kept in reserve and page-end
    // waste accounted for, so that any live set within it can be packed
    size_t total_capacity() const;

    std::vector<uint8_t> encode_entry(uint16_t key, const uint8_t* value, size_t length,
                                      EntryKind kind, Position position) const;
    Decoded decode_entry(const uint8_t* data, size_t available) const;

    std::vector<uint8_t> encode_page_header(uint32_t sequence) const;
    std::optional<uint32_t> decode_page_header(const uint8_t* data, size_t available) const;

    // First word of an entry with its live bit cleared
    std::vector<uint8_t> deletion_mark(const uint8_t* first_word) const;

    bool is_padding_word(const uint8_t* word) const;
    size_t round_up(size_t n) const {
        return (n + geometry_.word_size - 1) / geometry_.word_size * geometry_.word_size;
    }

private:
    Geometry geometry_;
    size_t page_header_size_;
    size_t max_value_length_;
};

} // namespace store
} // namespace flashkv
