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
#include <vector>
#include "format.h"
#include "index.h"
#include "metrics.h"
#include "storage.h"

namespace flashkv {
namespace store {

enum class PageState : uint8_t {
    Free,        // outside the ring, erased or waiting to be erased
    Used,        // between head and tail
    Compacting   // head page whose live entries are being relocated
};

/**
 * Append-only ring of pages.
 *
 * Pages head..tail (ring order) hold entries; sequence numbers increase by
 * one along the ring. New entries go to the tail at the cursor. One free
 * page is held in reserve for compaction: a regular append may only open a
 * new page while at least two pages are free.
 */
class LogStore {
public:
    LogStore(Storage& storage, const Format& format, StoreMetrics& metrics);

    // Empty log: page 0 with sequence 1. Other pages become free.
    void start_fresh();

    // Adopt the state recovery found on flash
    void restore(size_t head, size_t tail, uint32_t tail_seq, size_t cursor);

    // Whether entries of these encoded sizes can be appended in order
    // without compaction
    bool fits(const std::vector<size_t>& sizes, bool allow_reserve) const;

    // Writes one encoded entry; opens the next page when it does not fit at
    // the cursor. Throws NoSpaceLeft when no page may be opened.
    Location append(const std::vector<uint8_t>& bytes, size_t value_length, bool allow_reserve);

    // Moves the tail to the next page in ring order, erasing it if needed
    void advance_page(bool allow_reserve);

    // Erases the head page and drops it from the ring. Head must not be tail.
    void erase_head();

    // Clears the live bit in the first word of the entry at location
    void mark_deleted(const Location& location);

    // Raw bytes of an entry
    std::vector<uint8_t> read(const Location& location) const;

    size_t head() const { return head_; }
    size_t tail() const { return tail_; }
    uint32_t tail_seq() const { return tail_seq_; }
    size_t cursor() const { return cursor_; }

    size_t used_pages() const;
    size_t free_pages() const { return format_.num_pages() - used_pages(); }
    size_t next_page(size_t page) const { return (page + 1) % format_.num_pages(); }

    PageState page_state(size_t page) const { return states_.at(page); }
    void set_compacting(size_t page);

    // Erases issued by this instance, per page
    size_t erase_count(size_t page) const { return erase_counts_.at(page); }
    const std::vector<size_t>& erase_counts() const { return erase_counts_; }

    // Erase a page unconditionally, counting it
    void erase_page(size_t page);

private:
    void open_page(size_t page, uint32_t seq);

    Storage& storage_;
    const Format& format_;
    StoreMetrics& metrics_;

    size_t   head_ = 0;
    size_t   tail_ = 0;
    uint32_t tail_seq_ = 0;
    size_t   cursor_ = 0;

    std::vector<PageState> states_;
    std::vector<size_t> erase_counts_;
};

} // namespace store
} // namespace flashkv
