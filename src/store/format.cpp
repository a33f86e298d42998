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

#include "format.h"
#include "checksums.h"
#include "store_error.h"
#include "../util/endian.hpp"
#include <algorithm>
#include <cstring>
#include <string>

namespace flashkv {
namespace store {

using util::load_le16;
using util::load_le32;
using util::store_le16;
using util::store_le32;

namespace {

inline size_t round_up4(size_t n) {
    return (n + 3) & ~size_t(3);
}

inline bool is_power_of_two(size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

} // namespace

const char* to_string(Position position) {
    switch (position) {
        case Position::Standalone: return "standalone";
        case Position::Begin:      return "begin";
        case Position::Continue:   return "continue";
        case Position::End:        return "end";
    }
    return "unknown";
}

// ============================================================================
// Fragment header word
// ============================================================================

uint32_t FragmentHeader::pack() const {
    uint32_t word = 0;
    word |= static_cast<uint32_t>(key & 0xFFF);
    word |= static_cast<uint32_t>(length) << 12;
    word |= static_cast<uint32_t>(remaining & 0xF) << 22;
    word |= static_cast<uint32_t>(kind == EntryKind::Tombstone ? 1 : 0) << 26;
    word |= static_cast<uint32_t>(position) << 27;
    word |= kReservedMask;
    if (live) word |= kLiveBit;
    return word;  // present bit stays 0
}

std::optional<FragmentHeader> FragmentHeader::unpack(uint32_t word) {
    if ((word & kPresentBit) != 0 || (word & kReservedMask) != kReservedMask) {
        return std::nullopt;
    }
    FragmentHeader h;
    h.key       = static_cast<uint16_t>(word & 0xFFF);
    h.length    = static_cast<uint8_t>((word >> 12) & 0xFF);
    h.remaining = static_cast<uint8_t>((word >> 22) & 0xF);
    h.kind      = ((word >> 26) & 1) ? EntryKind::Tombstone : EntryKind::Value;
    h.position  = static_cast<Position>((word >> 27) & 3);
    h.live      = (word & kLiveBit) != 0;
    return h;
}

Geometry Geometry::of(const Storage& storage) {
    Geometry g;
    g.word_size = storage.word_size();
    g.page_size = storage.page_size();
    g.num_pages = storage.num_pages();
    g.max_word_writes = storage.max_word_writes();
    g.max_page_erases = storage.max_page_erases();
    return g;
}

// ============================================================================
// Format
// ============================================================================

Format::Format(const Geometry& geometry, size_t max_value_length)
    : geometry_(geometry), page_header_size_(0), max_value_length_(0) {
    const size_t w = geometry_.word_size;
    if (geometry_.num_pages < limits::kMinPages) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "need at least " + std::to_string(limits::kMinPages) + " pages, driver has " +
                         std::to_string(geometry_.num_pages));
    }
    if (!is_power_of_two(w) || w < limits::kMinWordSize || w > limits::kMaxWordSize) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "unsupported word size " + std::to_string(w));
    }
    if (geometry_.page_size % w != 0 || geometry_.page_size > limits::kMaxPageSize) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "unsupported page size " + std::to_string(geometry_.page_size));
    }
    if (geometry_.max_word_writes < limits::kMinWordWrites) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "need " + std::to_string(limits::kMinWordWrites) +
                         " writes per word, driver allows " + std::to_string(geometry_.max_word_writes));
    }
    if (max_value_length == 0 || max_value_length > limits::kMaxValueLength) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "max value length " + std::to_string(max_value_length) + " out of range");
    }

    page_header_size_ = round_up(format::kPageHeaderBytes);
    if (geometry_.page_size <= page_header_size_) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "page size " + std::to_string(geometry_.page_size) + " too small");
    }

    // Largest value whose entry fits in an empty page
    size_t len = max_value_length;
    while (len > 0 && entry_size(len) > page_capacity()) {
        len--;
    }
    if (len == 0) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "page size " + std::to_string(geometry_.page_size) + " too small");
    }
    max_value_length_ = len;
}

size_t Format::fragment_count(size_t value_length) const {
    if (value_length == 0) return 1;
    return (value_length + format::kMaxFragmentPayload - 1) / format::kMaxFragmentPayload;
}

size_t Format::entry_size(size_t value_length) const {
    const size_t n = fragment_count(value_length);
    const size_t last = value_length - (n - 1) * format::kMaxFragmentPayload;
    const size_t full = round_up(format::kFragmentHeaderBytes + format::kMaxFragmentPayload);
    return (n - 1) * full +
           round_up(round_up4(format::kFragmentHeaderBytes + last) + format::kChecksumBytes);
}

size_t Format::total_capacity() const {
    const size_t pages = geometry_.num_pages;
    const size_t waste = entry_size(max_value_length_) - geometry_.word_size;
    const size_t gross = (pages - 1) * page_capacity();
    const size_t lost = (pages - 2) * waste;
    return gross > lost ? gross - lost : 0;
}

std::vector<uint8_t> Format::encode_entry(uint16_t key, const uint8_t* value, size_t length,
                                          EntryKind kind, Position position) const {
    if (key > limits::kMaxKey) {
        throw StoreError(StoreErrorCode::InvalidArgument, "key " + std::to_string(key) + " out of range");
    }
    if (length > max_value_length_) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "value of " + std::to_string(length) + " bytes exceeds " +
                         std::to_string(max_value_length_));
    }

    std::vector<uint8_t> out(entry_size(length), 0xFF);
    const size_t n = fragment_count(length);
    CRC32C crc;
    size_t off = 0;
    size_t consumed = 0;

    for (size_t i = 0; i < n; i++) {
        const bool last = (i + 1 == n);
        FragmentHeader h;
        h.key = key;
        h.length = static_cast<uint8_t>(last ? length - consumed : format::kMaxFragmentPayload);
        h.remaining = static_cast<uint8_t>(n - 1 - i);
        h.kind = kind;
        h.position = position;
        h.live = true;

        uint8_t word[4];
        store_le32(word, h.pack());
        std::memcpy(out.data() + off, word, 4);
        if (h.length > 0) {
            std::memcpy(out.data() + off + 4, value + consumed, h.length);
        }
        crc.update(word, 4);
        crc.update(value + consumed, h.length);
        consumed += h.length;

        if (last) {
            const size_t crc_off = off + round_up4(format::kFragmentHeaderBytes + h.length);
            store_le32(out.data() + crc_off, crc.finalize());
        } else {
            off += round_up(format::kFragmentHeaderBytes + h.length);
        }
    }
    return out;
}

Decoded Format::decode_entry(const uint8_t* data, size_t available) const {
    const size_t w = geometry_.word_size;
    Decoded out;

    if (available < w || is_erased(data, w)) {
        out.status = DecodeStatus::Erased;
        return out;
    }
    if (is_padding_word(data)) {
        out.status = DecodeStatus::Padding;
        out.extent = w;
        return out;
    }

    CRC32C crc;
    FragmentHeader first;
    size_t off = 0;

    for (size_t i = 0; ; i++) {
        // A missing fragment: everything from here on was never written
        if (off + w > available || is_erased(data + off, w)) {
            out.extent = off;
            return out;
        }

        const uint32_t word = load_le32(data + off);
        std::optional<FragmentHeader> h = FragmentHeader::unpack(word);
        if (!h) {
            out.extent = off + w;
            return out;
        }
        if (i == 0) {
            first = *h;
        } else if (h->key != first.key || h->kind != first.kind || h->position != first.position ||
                   static_cast<size_t>(h->remaining) + i != first.remaining) {
            out.extent = off + w;
            return out;
        }

        const bool last = (h->remaining == 0);
        if (!last && h->length != format::kMaxFragmentPayload) {
            out.extent = off + w;
            return out;
        }
        const size_t crc_off = off + round_up4(format::kFragmentHeaderBytes + h->length);
        const size_t frag_end = last
            ? off + round_up(crc_off - off + format::kChecksumBytes)
            : off + round_up(format::kFragmentHeaderBytes + h->length);
        if (frag_end > available) {
            out.extent = off + w;
            return out;
        }

        uint8_t canonical[4];
        store_le32(canonical, word | FragmentHeader::kLiveBit);
        crc.update(canonical, 4);
        crc.update(data + off + 4, h->length);
        out.entry.value.insert(out.entry.value.end(), data + off + 4, data + off + 4 + h->length);

        if (last) {
            out.extent = frag_end;
            if (load_le32(data + crc_off) != crc.finalize()) {
                out.entry.value.clear();
                return out;
            }
            out.status = DecodeStatus::Valid;
            out.entry.key = first.key;
            out.entry.kind = first.kind;
            out.entry.position = first.position;
            out.entry.live = first.live;
            return out;
        }
        off = frag_end;
    }
}

std::vector<uint8_t> Format::encode_page_header(uint32_t sequence) const {
    std::vector<uint8_t> out(page_header_size_, 0xFF);
    store_le16(out.data(), format::kPageMagic);
    out[2] = format::kFormatVersion;
    out[3] = 0xFF;
    store_le32(out.data() + 4, sequence);
    store_le32(out.data() + 8, crc32c(out.data(), 8));
    return out;
}

std::optional<uint32_t> Format::decode_page_header(const uint8_t* data, size_t available) const {
    if (available < format::kPageHeaderBytes) {
        return std::nullopt;
    }
    if (load_le16(data) != format::kPageMagic || data[2] != format::kFormatVersion) {
        return std::nullopt;
    }
    if (load_le32(data + 8) != crc32c(data, 8)) {
        return std::nullopt;
    }
    return load_le32(data + 4);
}

std::vector<uint8_t> Format::deletion_mark(const uint8_t* first_word) const {
    std::vector<uint8_t> out(first_word, first_word + geometry_.word_size);
    const uint32_t word = load_le32(out.data()) & ~FragmentHeader::kLiveBit;
    store_le32(out.data(), word);
    return out;
}

bool Format::is_padding_word(const uint8_t* word) const {
    return std::all_of(word, word + geometry_.word_size, [](uint8_t b) { return b == 0; });
}

} // namespace store
} // namespace flashkv
