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

namespace flashkv {
namespace store {

// Byte position inside the flash: a page and a byte offset within it
struct StorageIndex {
    size_t page;
    size_t byte;
};

/**
 * Abstract flash driver.
 *
 * Words start erased (all bits set). A write may only clear bits and each
 * word may be written at most max_word_writes() times before its page is
 * erased again. Implementations report faults by throwing StoreError with
 * StorageError (hardware) or OutOfBounds (address arithmetic).
 */
class Storage {
public:
    virtual ~Storage() = default;

    // Geometry, fixed for the lifetime of the driver
    virtual size_t word_size() const = 0;
    virtual size_t page_size() const = 0;
    virtual size_t num_pages() const = 0;
    virtual size_t max_word_writes() const = 0;
    virtual size_t max_page_erases() const = 0;

    // Reads length bytes starting at index; the range must stay in one page
    virtual std::vector<uint8_t> read_slice(StorageIndex index, size_t length) const = 0;

    // Writes whole words starting at a word-aligned index
    virtual void write_slice(StorageIndex index, const uint8_t* data, size_t length) = 0;

    // Resets every word of the page to erased
    virtual void erase_page(size_t page) = 0;

    void write_slice(StorageIndex index, const std::vector<uint8_t>& value) {
        write_slice(index, value.data(), value.size());
    }

    size_t storage_size() const { return page_size() * num_pages(); }
};

// Throws OutOfBounds unless [index, index + length) lies in one page and,
// for writes, starts and ends on word boundaries.
void check_slice(const Storage& storage, StorageIndex index, size_t length, bool for_write);

// Throws OutOfBounds unless page < num_pages()
void check_page(const Storage& storage, size_t page);

// True when every byte of the slice is 0xFF
bool is_erased(const uint8_t* data, size_t length);

} // namespace store
} // namespace flashkv
