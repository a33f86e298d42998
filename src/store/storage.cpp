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

#include "storage.h"
#include "store_error.h"
#include <string>

namespace flashkv {
namespace store {

void check_slice(const Storage& storage, StorageIndex index, size_t length, bool for_write) {
    const size_t page_size = storage.page_size();
    if (index.page >= storage.num_pages() || index.byte > page_size ||
        length > page_size - index.byte) {
        throw StoreError(StoreErrorCode::OutOfBounds,
                         "slice page=" + std::to_string(index.page) +
                         " byte=" + std::to_string(index.byte) +
                         " len=" + std::to_string(length));
    }
    if (for_write) {
        const size_t word = storage.word_size();
        if (index.byte % word != 0 || length % word != 0) {
            throw StoreError(StoreErrorCode::OutOfBounds,
                             "unaligned write at page=" + std::to_string(index.page) +
                             " byte=" + std::to_string(index.byte) +
                             " len=" + std::to_string(length));
        }
    }
}

void check_page(const Storage& storage, size_t page) {
    if (page >= storage.num_pages()) {
        throw StoreError(StoreErrorCode::OutOfBounds,
                         "page " + std::to_string(page) + " of " +
                         std::to_string(storage.num_pages()));
    }
}

bool is_erased(const uint8_t* data, size_t length) {
    for (size_t i = 0; i < length; i++) {
        if (data[i] != 0xFF) {
            return false;
        }
    }
    return true;
}

} // namespace store
} // namespace flashkv
