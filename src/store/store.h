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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "compactor.h"
#include "format.h"
#include "index.h"
#include "log_store.h"
#include "metrics.h"
#include "recovery.h"
#include "storage.h"
#include "store_config.h"
#include "store_error.h"
#include "transaction.h"

namespace flashkv {
namespace store {

/**
 * Persistent key-value store on erase-granular flash.
 *
 * Keys are 0..4095, values up to max_value_length() bytes. Every mutation is
 * atomic with respect to power loss. After a StorageCorrupted failure the
 * store refuses everything but clear(), capacity() and metrics().
 */
class Store {
public:
    // Validates the geometry (InvalidArgument) and recovers the log.
    // Corruption found at open leaves the store in the corrupted state.
    static std::unique_ptr<Store> open(Storage& storage,
                                       const StoreConfig& config = StoreConfig::defaults());

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    std::optional<std::vector<uint8_t>> find(uint16_t key);

    void insert(uint16_t key, const std::vector<uint8_t>& value);
    void insert(uint16_t key, const uint8_t* value, size_t length);
    void remove(uint16_t key);
    void transaction(const std::vector<Operation>& operations);

    // Removes every key >= min_key in one transaction
    void clear_from(uint16_t min_key);

    // Factory reset: erases every page
    void clear();

    // Bytes available to entries, and bytes their live entries occupy
    size_t capacity() const { return format_.total_capacity(); }
    size_t used() const;

    std::vector<uint16_t> keys() const;
    size_t max_value_length() const { return format_.max_value_length(); }
    const Format& format() const { return format_; }
    const Geometry& geometry() const { return format_.geometry(); }

    bool corrupted() const { return corrupted_; }
    const std::string& corruption_reason() const { return corruption_reason_; }
    const StoreMetrics& metrics() const { return metrics_; }

private:
    Store(Storage& storage, const StoreConfig& config);

    void recover();
    void ensure_usable() const;
    void mutate(const std::function<void()>& fn);
    void note_failure(const StoreError& e);

    Storage& storage_;
    StoreConfig config_;
    Format format_;
    StoreMetrics metrics_;
    Index index_;
    LogStore log_;
    Compactor compactor_;
    TransactionManager txn_;

    bool corrupted_ = false;
    bool needs_recovery_ = false;
    std::string corruption_reason_;
};

} // namespace store
} // namespace flashkv
