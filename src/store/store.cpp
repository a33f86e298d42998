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

#include "store.h"
#include "store_error.h"
#include "../util/log.h"
#include <string>

namespace flashkv {
namespace store {

namespace {

StoreConfig checked(const StoreConfig& config) {
    if (!config.validate()) {
        throw StoreError(StoreErrorCode::InvalidArgument,
                         "max value length " + std::to_string(config.max_value_length) + " out of range");
    }
    return config;
}

} // namespace

Store::Store(Storage& storage, const StoreConfig& config)
    : storage_(storage),
      config_(checked(config)),
      format_(Geometry::of(storage), config_.max_value_length),
      log_(storage_, format_, metrics_),
      compactor_(format_, log_, index_, metrics_, config_),
      txn_(format_, log_, index_, compactor_) {}

std::unique_ptr<Store> Store::open(Storage& storage, const StoreConfig& config) {
    std::unique_ptr<Store> store(new Store(storage, config));
    try {
        store->recover();
    } catch (const StoreError& e) {
        if (e.code() != StoreErrorCode::StorageCorrupted) {
            throw;
        }
        store->note_failure(e);
        return store;
    }
    info() << "store: opened " << store->format_.num_pages() << " x " << store->format_.page_size()
           << " bytes, " << store->index_.size() << " keys, " << store->used() << "/"
           << store->capacity() << " bytes used";
    return store;
}

void Store::recover() {
    RecoveryScanner scanner(storage_, format_, log_, index_, metrics_);
    RecoveryResult result = scanner.run();

    if (log_.free_pages() == 0) {
        // Power was lost between relocating a page and erasing it
        warning() << "store: no free page after recovery, finishing interrupted compaction of page "
                  << log_.head();
        try {
            compactor_.compact_once();
        } catch (const StoreError& e) {
            if (e.code() != StoreErrorCode::NoSpaceLeft) {
                throw;
            }
            throw StoreError(StoreErrorCode::StorageCorrupted,
                             std::string("cannot finish interrupted compaction: ") + e.what());
        }
    }
    needs_recovery_ = false;
    debug() << "store: recovered, " << result.entries_scanned << " entries scanned, "
            << result.torn_tails << " torn, " << result.transactions_discarded << " discarded";
}

void Store::note_failure(const StoreError& e) {
    switch (e.code()) {
        case StoreErrorCode::StorageCorrupted:
            corrupted_ = true;
            corruption_reason_ = e.what();
            severe() << "store: " << e.what();
            break;
        case StoreErrorCode::StorageError:
            needs_recovery_ = true;
            warning() << "store: " << e.what() << ", recovering before next write";
            break;
        default:
            break;
    }
}

void Store::ensure_usable() const {
    if (corrupted_) {
        throw StoreError(StoreErrorCode::StorageCorrupted, "store is corrupted: " + corruption_reason_);
    }
}

void Store::mutate(const std::function<void()>& fn) {
    ensure_usable();
    try {
        if (needs_recovery_) {
            recover();
        }
        fn();
    } catch (const StoreError& e) {
        note_failure(e);
        throw;
    }
}

std::optional<std::vector<uint8_t>> Store::find(uint16_t key) {
    ensure_usable();
    if (key > limits::kMaxKey) {
        throw StoreError(StoreErrorCode::InvalidArgument, "key " + std::to_string(key) + " out of range");
    }
    std::optional<std::vector<uint8_t>> out;
    mutate([&]() {
        const Location* loc = index_.find(key);
        if (!loc) {
            return;
        }
        std::vector<uint8_t> bytes = log_.read(*loc);
        Decoded d = format_.decode_entry(bytes.data(), bytes.size());
        if (d.status != DecodeStatus::Valid || d.entry.key != key) {
            throw StoreError(StoreErrorCode::StorageCorrupted,
                             "entry for key " + std::to_string(key) + " on page " +
                             std::to_string(loc->page) + " offset " + std::to_string(loc->offset) +
                             " does not decode");
        }
        out = std::move(d.entry.value);
    });
    return out;
}

void Store::insert(uint16_t key, const std::vector<uint8_t>& value) {
    transaction({Operation::insert(key, value)});
}

void Store::insert(uint16_t key, const uint8_t* value, size_t length) {
    insert(key, std::vector<uint8_t>(value, value + length));
}

void Store::remove(uint16_t key) {
    transaction({Operation::remove(key)});
}

void Store::transaction(const std::vector<Operation>& operations) {
    mutate([&]() { txn_.apply(operations); });
}

void Store::clear_from(uint16_t min_key) {
    ensure_usable();
    std::vector<Operation> ops;
    for (uint16_t key : index_.keys()) {
        if (key >= min_key) {
            ops.push_back(Operation::remove(key));
        }
    }
    transaction(ops);
}

void Store::clear() {
    try {
        for (size_t p = 0; p < format_.num_pages(); p++) {
            std::vector<uint8_t> page = storage_.read_slice(StorageIndex{p, 0}, format_.page_size());
            if (!is_erased(page.data(), page.size())) {
                log_.erase_page(p);
            }
        }
        log_.start_fresh();
    } catch (const StoreError& e) {
        needs_recovery_ = true;
        warning() << "store: clear failed: " << e.what();
        throw;
    }
    index_.clear();
    corrupted_ = false;
    corruption_reason_.clear();
    needs_recovery_ = false;
    info() << "store: cleared";
}

size_t Store::used() const {
    ensure_usable();
    return index_.live_bytes();
}

std::vector<uint16_t> Store::keys() const {
    ensure_usable();
    return index_.keys();
}

} // namespace store
} // namespace flashkv
