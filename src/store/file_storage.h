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
#include <fstream>
#include <string>

namespace flashkv {
namespace store {

struct FileStorageOptions {
    size_t word_size       = 4;
    size_t page_size       = 4096;
    size_t num_pages       = 16;
    size_t max_word_writes = 2;
    size_t max_page_erases = 10000;

    // Host runner geometry
    static FileStorageOptions host() {
        return FileStorageOptions();
    }

    // Storage partition of an nRF52840 style part: 4 KiB pages, 20 of them
    static FileStorageOptions nordic() {
        FileStorageOptions opts;
        opts.num_pages = 20;
        return opts;
    }

    // Small image matching a 2-page test part
    static FileStorageOptions tiny() {
        FileStorageOptions opts;
        opts.page_size = 256;
        opts.num_pages = 2;
        return opts;
    }
};

/**
 * Flash image backed by a host file.
 *
 * A missing file is created fully erased. An existing file must match the
 * configured geometry exactly. Every write and erase is flushed before
 * returning, so killing the process behaves like a power cut.
 */
class FileStorage : public Storage {
public:
    FileStorage(const std::string& path, const FileStorageOptions& options = FileStorageOptions());
    ~FileStorage() override;

    FileStorage(const FileStorage&) = delete;
    FileStorage& operator=(const FileStorage&) = delete;

    size_t word_size() const override { return options_.word_size; }
    size_t page_size() const override { return options_.page_size; }
    size_t num_pages() const override { return options_.num_pages; }
    size_t max_word_writes() const override { return options_.max_word_writes; }
    size_t max_page_erases() const override { return options_.max_page_erases; }

    using Storage::write_slice;
    std::vector<uint8_t> read_slice(StorageIndex index, size_t length) const override;
    void write_slice(StorageIndex index, const uint8_t* data, size_t length) override;
    void erase_page(size_t page) override;

    const std::string& path() const { return path_; }

private:
    std::streamoff offset(StorageIndex index) const {
        return static_cast<std::streamoff>(index.page * options_.page_size + index.byte);
    }
    void write_at(std::streamoff pos, const uint8_t* data, size_t length);

    std::string path_;
    FileStorageOptions options_;
    mutable std::fstream file_;
};

} // namespace store
} // namespace flashkv
