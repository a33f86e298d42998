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

#include "buffer_storage.h"
#include "store_error.h"
#include "../util/log.h"
#include <algorithm>
#include <string>

namespace flashkv {
namespace store {

BufferStorage::BufferStorage(const BufferOptions& options)
    : options_(options) {
    if (options_.word_size == 0 || options_.page_size % options_.word_size != 0) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "page size " + std::to_string(options_.page_size) +
                         " is not a multiple of word size " + std::to_string(options_.word_size));
    }
    bytes_.assign(options_.page_size * options_.num_pages, 0xFF);
    word_writes_.assign(bytes_.size() / options_.word_size, 0);
    page_erases_.assign(options_.num_pages, 0);
}

std::vector<uint8_t> BufferStorage::read_slice(StorageIndex index, size_t length) const {
    check_slice(*this, index, length, false);
    auto begin = bytes_.begin() + offset(index);
    return std::vector<uint8_t>(begin, begin + length);
}

void BufferStorage::write_slice(StorageIndex index, const uint8_t* data, size_t length) {
    check_slice(*this, index, length, true);

    const size_t word = options_.word_size;
    const size_t base = offset(index);
    for (size_t pos = 0; pos < length; pos += word) {
        if (armed_) {
            if (remaining_writes_ == 0) {
                interrupted_ = true;
                throw StoreError(StoreErrorCode::StorageError,
                                 "power loss at page=" + std::to_string(index.page) +
                                 " byte=" + std::to_string(index.byte + pos));
            }
            remaining_writes_--;
        }

        const size_t w = (base + pos) / word;
        if (word_writes_[w] >= options_.max_word_writes) {
            throw StoreError(StoreErrorCode::StorageError,
                             "word write budget exceeded at page=" + std::to_string(index.page) +
                             " byte=" + std::to_string(index.byte + pos));
        }
        for (size_t i = 0; i < word; i++) {
            const uint8_t old_byte = bytes_[base + pos + i];
            const uint8_t new_byte = data[pos + i];
            if ((old_byte & new_byte) != new_byte) {
                throw StoreError(StoreErrorCode::StorageError,
                                 "write sets bits at page=" + std::to_string(index.page) +
                                 " byte=" + std::to_string(index.byte + pos + i));
            }
        }
        std::copy(data + pos, data + pos + word, bytes_.begin() + base + pos);
        word_writes_[w]++;
        total_word_writes_++;
    }
}

void BufferStorage::erase_page(size_t page) {
    check_page(*this, page);
    if (armed_ && remaining_writes_ == 0) {
        interrupted_ = true;
        throw StoreError(StoreErrorCode::StorageError,
                         "power loss before erase of page " + std::to_string(page));
    }
    if (page_erases_[page] >= options_.max_page_erases) {
        throw StoreError(StoreErrorCode::StorageError,
                         "page " + std::to_string(page) + " is worn out");
    }

    const size_t base = page * options_.page_size;
    std::fill(bytes_.begin() + base, bytes_.begin() + base + options_.page_size, 0xFF);
    const size_t first_word = base / options_.word_size;
    std::fill(word_writes_.begin() + first_word,
              word_writes_.begin() + first_word + options_.page_size / options_.word_size, 0);
    page_erases_[page]++;
    trace() << "buffer storage: erased page " << page << " (" << page_erases_[page] << " erases)";
}

void BufferStorage::arm_interruption(size_t word_writes) {
    armed_ = true;
    remaining_writes_ = word_writes;
    interrupted_ = false;
}

void BufferStorage::disarm_interruption() {
    armed_ = false;
    remaining_writes_ = 0;
}

size_t BufferStorage::word_writes(StorageIndex index) const {
    check_slice(*this, index, 0, false);
    return word_writes_[offset(index) / options_.word_size];
}

BufferStorage::Snapshot BufferStorage::snapshot() const {
    return Snapshot{bytes_, word_writes_, page_erases_};
}

void BufferStorage::restore(const Snapshot& snapshot) {
    bytes_ = snapshot.bytes;
    word_writes_ = snapshot.word_writes;
    page_erases_ = snapshot.page_erases;
    interrupted_ = false;
}

} // namespace store
} // namespace flashkv
