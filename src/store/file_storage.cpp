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

#include "file_storage.h"
#include "store_error.h"
#include "../util/log.h"
#include <boost/filesystem.hpp>
#include <vector>

namespace flashkv {
namespace store {

FileStorage::FileStorage(const std::string& path, const FileStorageOptions& options)
    : path_(path), options_(options) {
    if (options_.word_size == 0 || options_.page_size % options_.word_size != 0) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "page size " + std::to_string(options_.page_size) +
                         " is not a multiple of word size " + std::to_string(options_.word_size));
    }

    const uint64_t expected = static_cast<uint64_t>(options_.page_size) * options_.num_pages;
    boost::system::error_code ec;
    if (boost::filesystem::exists(path_, ec)) {
        uint64_t size = boost::filesystem::file_size(path_, ec);
        if (ec) {
            throw StoreError(StoreErrorCode::StorageError,
                             "can't stat " + path_ + ": " + ec.message());
        }
        if (size != expected) {
            throw StoreError(StoreErrorCode::InvalidArgument,
                             path_ + " has " + std::to_string(size) + " bytes, geometry needs " +
                             std::to_string(expected));
        }
        debug() << "file storage: reopened " << path_;
    } else {
        boost::filesystem::path parent = boost::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            boost::filesystem::create_directories(parent, ec);
            if (ec) {
                throw StoreError(StoreErrorCode::StorageError,
                                 "can't create " + parent.string() + ": " + ec.message());
            }
        }
        std::ofstream create(path_, std::ios::binary | std::ios::trunc);
        std::vector<char> erased(options_.page_size, static_cast<char>(0xFF));
        for (size_t p = 0; p < options_.num_pages && create; p++) {
            create.write(erased.data(), static_cast<std::streamsize>(erased.size()));
        }
        create.flush();
        if (!create) {
            throw StoreError(StoreErrorCode::StorageError,
                             "can't create flash image " + path_ + ": " + errnoWithDescription());
        }
        info() << "file storage: created " << path_ << " (" << options_.num_pages << " x "
               << options_.page_size << " bytes)";
    }

    file_.open(path_, std::ios::binary | std::ios::in | std::ios::out);
    if (!file_) {
        throw StoreError(StoreErrorCode::StorageError,
                         "can't open flash image " + path_ + ": " + errnoWithDescription());
    }
}

FileStorage::~FileStorage() {
    if (file_.is_open()) {
        file_.close();
    }
}

std::vector<uint8_t> FileStorage::read_slice(StorageIndex index, size_t length) const {
    check_slice(*this, index, length, false);
    std::vector<uint8_t> out(length);
    file_.seekg(offset(index));
    file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(length));
    if (!file_) {
        file_.clear();
        throw StoreError(StoreErrorCode::StorageError,
                         "read failed at page=" + std::to_string(index.page) +
                         " byte=" + std::to_string(index.byte));
    }
    return out;
}

void FileStorage::write_slice(StorageIndex index, const uint8_t* data, size_t length) {
    check_slice(*this, index, length, true);

    // Flash can only clear bits
    std::vector<uint8_t> current = read_slice(index, length);
    for (size_t i = 0; i < length; i++) {
        if ((current[i] & data[i]) != data[i]) {
            throw StoreError(StoreErrorCode::StorageError,
                             "write sets bits at page=" + std::to_string(index.page) +
                             " byte=" + std::to_string(index.byte + i));
        }
    }
    write_at(offset(index), data, length);
}

void FileStorage::erase_page(size_t page) {
    check_page(*this, page);
    std::vector<uint8_t> erased(options_.page_size, 0xFF);
    write_at(offset(StorageIndex{page, 0}), erased.data(), erased.size());
}

void FileStorage::write_at(std::streamoff pos, const uint8_t* data, size_t length) {
    file_.seekp(pos);
    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    file_.flush();
    if (!file_) {
        file_.clear();
        throw StoreError(StoreErrorCode::StorageError,
                         "write failed at offset " + std::to_string(pos) + " of " + path_);
    }
}

} // namespace store
} // namespace flashkv
