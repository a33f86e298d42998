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
#include "storage.h"
#include <cstdint>
#include <vector>

namespace flashkv {
namespace store {

struct BufferOptions {
    size_t word_size       = 4;
    size_t page_size       = 256;
    size_t num_pages       = 2;
    size_t max_word_writes = 2;
    size_t max_page_erases = 10000;
};

/**
 * In-memory flash model.
 *
 * Enforces the flash rules a real part enforces (clear-only writes, word
 * write budget, erase budget) and keeps per-word and per-page counters.
 * Power loss is simulated by arming an interruption: after the armed number
 * of word writes every further write or erase throws StorageError, leaving
 * the words written before the cut in place.
 */
class BufferStorage : public Storage {
public:
    struct Snapshot {
        std::vector<uint8_t>  bytes;
        std::vector<uint32_t> word_writes;
        std::vector<uint32_t> page_erases;
    };

    explicit BufferStorage(const BufferOptions& options = BufferOptions());

    size_t word_size() const override { return options_.word_size; }
    size_t page_size() const override { return options_.page_size; }
    size_t num_pages() const override { return options_.num_pages; }
    size_t max_word_writes() const override { return options_.max_word_writes; }
    size_t max_page_erases() const override { return options_.max_page_erases; }

    using Storage::write_slice;
    std::vector<uint8_t> read_slice(StorageIndex index, size_t length) const override;
    void write_slice(StorageIndex index, const uint8_t* data, size_t length) override;
    void erase_page(size_t page) override;

    // Power loss after `word_writes` more word writes
    void arm_interruption(size_t word_writes);
    void disarm_interruption();
    bool interrupted() const { return interrupted_; }

    // Counters
    size_t page_erases(size_t page) const { return page_erases_.at(page); }
    size_t word_writes(StorageIndex index) const;
    size_t total_word_writes() const { return total_word_writes_; }

    // Snapshots let a test replay the same operation from the same state
    Snapshot snapshot() const;
    void restore(const Snapshot& snapshot);

    // Direct access for fault injection in tests
    std::vector<uint8_t>& bytes() { return bytes_; }

private:
    size_t offset(StorageIndex index) const {
        return index.page * options_.page_size + index.byte;
    }

    BufferOptions options_;
    std::vector<uint8_t>  bytes_;
    std::vector<uint32_t> word_writes_;
    std::vector<uint32_t> page_erases_;
    size_t total_word_writes_ = 0;

    bool   armed_ = false;
    size_t remaining_writes_ = 0;
    bool   interrupted_ = false;
};

} // namespace store
} // namespace flashkv
