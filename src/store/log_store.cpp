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

#include "log_store.h"
#include "store_error.h"
#include "../util/log.h"
#include <string>

namespace flashkv {
namespace store {

LogStore::LogStore(Storage& storage, const Format& format, StoreMetrics& metrics)
    : storage_(storage), format_(format), metrics_(metrics),
      states_(format.num_pages(), PageState::Free),
      erase_counts_(format.num_pages(), 0) {}

void LogStore::start_fresh() {
    for (auto& s : states_) {
        s = PageState::Free;
    }
    open_page(0, 1);
    head_ = 0;
    debug() << "log store: started fresh on page 0";
}

void LogStore::restore(size_t head, size_t tail, uint32_t tail_seq, size_t cursor) {
    const size_t n = format_.num_pages();
    if (head >= n || tail >= n || cursor > format_.page_size()) {
        throw StoreError(StoreErrorCode::OutOfBounds,
                         "restore head=" + std::to_string(head) + " tail=" + std::to_string(tail) +
                         " cursor=" + std::to_string(cursor));
    }
    head_ = head;
    tail_ = tail;
    tail_seq_ = tail_seq;
    cursor_ = cursor;

    for (auto& s : states_) {
        s = PageState::Free;
    }
    for (size_t p = head_; ; p = next_page(p)) {
        states_[p] = PageState::Used;
        if (p == tail_) break;
    }
}

size_t LogStore::used_pages() const {
    const size_t n = format_.num_pages();
    return (tail_ + n - head_) % n + 1;
}

bool LogStore::fits(const std::vector<size_t>& sizes, bool allow_reserve) const {
    const size_t keep = allow_reserve ? 1 : 2;
    size_t free = free_pages();
    size_t cursor = cursor_;

    for (size_t size : sizes) {
        if (size > format_.page_capacity()) {
            return false;
        }
        if (cursor + size > format_.page_size()) {
            if (free < keep) {
                return false;
            }
            free--;
            cursor = format_.page_header_size();
        }
        cursor += size;
    }
    return true;
}

Location LogStore::append(const std::vector<uint8_t>& bytes, size_t value_length, bool allow_reserve) {
    if (bytes.size() > format_.page_capacity()) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "entry of " + std::to_string(bytes.size()) + " bytes exceeds page capacity " +
                         std::to_string(format_.page_capacity()));
    }
    if (cursor_ + bytes.size() > format_.page_size()) {
        advance_page(allow_reserve);
    }

    Location loc;
    loc.page = tail_;
    loc.offset = cursor_;
    loc.length = value_length;
    loc.size = bytes.size();

    storage_.write_slice(StorageIndex{tail_, cursor_}, bytes);
    cursor_ += bytes.size();

    metrics_.records_written.increment();
    metrics_.bytes_written.increment(bytes.size());
    return loc;
}

void LogStore::advance_page(bool allow_reserve) {
    const size_t keep = allow_reserve ? 1 : 2;
    if (free_pages() < keep) {
        throw StoreError(StoreErrorCode::NoSpaceLeft,
                         "no free page after page " + std::to_string(tail_) +
                         " (" + std::to_string(free_pages()) + " free)");
    }
    open_page(next_page(tail_), tail_seq_ + 1);
}

void LogStore::open_page(size_t page, uint32_t seq) {
    std::vector<uint8_t> current = storage_.read_slice(StorageIndex{page, 0}, format_.page_size());
    if (!is_erased(current.data(), current.size())) {
        erase_page(page);
    }
    storage_.write_slice(StorageIndex{page, 0}, format_.encode_page_header(seq));

    tail_ = page;
    tail_seq_ = seq;
    cursor_ = format_.page_header_size();
    states_[page] = PageState::Used;
    trace() << "log store: opened page " << page << " seq=" << seq;
}

void LogStore::erase_head() {
    if (head_ == tail_) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "cannot erase head page " + std::to_string(head_) + ": it is the tail");
    }
    erase_page(head_);
    states_[head_] = PageState::Free;
    head_ = next_page(head_);
}

void LogStore::erase_page(size_t page) {
    storage_.erase_page(page);
    erase_counts_.at(page)++;
    metrics_.page_erases.increment();
}

void LogStore::mark_deleted(const Location& location) {
    const size_t w = format_.word_size();
    std::vector<uint8_t> word = storage_.read_slice(StorageIndex{location.page, location.offset}, w);
    storage_.write_slice(StorageIndex{location.page, location.offset},
                         format_.deletion_mark(word.data()));
}

std::vector<uint8_t> LogStore::read(const Location& location) const {
    return storage_.read_slice(StorageIndex{location.page, location.offset}, location.size);
}

void LogStore::set_compacting(size_t page) {
    if (states_.at(page) != PageState::Used) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "page " + std::to_string(page) + " is not in use");
    }
    states_[page] = PageState::Compacting;
}

} // namespace store
} // namespace flashkv
