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
#include <cstdlib>
#include <memory>
#include <string>
#include "file_storage.h"
#include "storage.h"
#include "store.h"
#include "store_config.h"
#include "../util/logmanager.h"

namespace flashkv {
namespace store {

/**
 * Process-wide store handle created once at boot and passed by reference.
 * Owns the log redirection, the flash driver and the store on top of it.
 *
 * Without a storage path the board has no flash: the runtime boots with an
 * UnsupportedStorage driver and no store.
 */
class StoreRuntime {
public:
    struct Config {
        std::string storage_path;     // flash image; empty = no storage
        FileStorageOptions storage;
        StoreConfig store;
        std::string log_dir;          // empty = log to stderr

        Config() : store(StoreConfig::defaults()) {}

        static Config from_env() {
            Config config;
            if (const char* path = std::getenv("FLASHKV_STORAGE_PATH")) {
                config.storage_path = path;
            }
            if (const char* dir = std::getenv("FLASHKV_LOG_DIR")) {
                config.log_dir = dir;
            }
            return config;
        }
    };

    static std::unique_ptr<StoreRuntime> boot(const Config& config = Config::from_env());

    ~StoreRuntime();

    StoreRuntime(const StoreRuntime&) = delete;
    StoreRuntime& operator=(const StoreRuntime&) = delete;

    bool has_store() const { return store_ != nullptr; }

    // Throws InvalidArgument when booted without storage
    Store& store();
    Storage& storage() { return *storage_; }
    const Config& config() const { return config_; }

private:
    explicit StoreRuntime(const Config& config) : config_(config) {}

    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::unique_ptr<Storage> storage_;
    std::unique_ptr<Store> store_;
};

} // namespace store
} // namespace flashkv
