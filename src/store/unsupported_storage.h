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
#include "store_error.h"

namespace flashkv {
namespace store {

// Board without flash: zero pages, every access is out of bounds
class UnsupportedStorage : public Storage {
public:
    size_t word_size() const override { return 0; }
    size_t page_size() const override { return 0; }
    size_t num_pages() const override { return 0; }
    size_t max_word_writes() const override { return 0; }
    size_t max_page_erases() const override { return 0; }

    using Storage::write_slice;
    std::vector<uint8_t> read_slice(StorageIndex, size_t) const override {
        throw StoreError(StoreErrorCode::OutOfBounds, "no storage");
    }
    void write_slice(StorageIndex, const uint8_t*, size_t) override {
        throw StoreError(StoreErrorCode::OutOfBounds, "no storage");
    }
    void erase_page(size_t) override {
        throw StoreError(StoreErrorCode::OutOfBounds, "no storage");
    }
};

} // namespace store
} // namespace flashkv
