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

#include "transaction.h"
#include "store_error.h"
#include "../util/log.h"
#include <algorithm>
#include <string>
#include <unordered_set>

namespace flashkv {
namespace store {

TransactionManager::TransactionManager(const Format& format, LogStore& log, Index& index,
                                       Compactor& compactor)
    : format_(format), log_(log), index_(index), compactor_(compactor) {}

void TransactionManager::validate(const std::vector<Operation>& operations) const {
    for (const auto& op : operations) {
        if (op.key > limits::kMaxKey) {
            throw StoreError(StoreErrorCode::InvalidArgument,
                             "key " + std::to_string(op.key) + " out of range");
        }
        if (op.value && op.value->size() > format_.max_value_length()) {
            throw StoreError(StoreErrorCode::InvalidArgument,
                             "value of " + std::to_string(op.value->size()) +
                             " bytes for key " + std::to_string(op.key) + " exceeds " +
                             std::to_string(format_.max_value_length()));
        }
    }
}

std::vector<Operation> TransactionManager::reduce(const std::vector<Operation>& operations) const {
    std::vector<Operation> out;
    std::unordered_set<uint16_t> seen;
    for (auto it = operations.rbegin(); it != operations.rend(); ++it) {
        if (!seen.insert(it->key).second) {
            continue;
        }
        if (it->is_remove() && !index_.contains(it->key)) {
            continue;
        }
        out.push_back(*it);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

void TransactionManager::check_capacity(const std::vector<size_t>& sizes) const {
    // Old copies of replaced keys stay on flash until the new records are written
    size_t needed = index_.live_bytes();
    for (size_t size : sizes) {
        needed += size;
    }
    if (needed > format_.total_capacity()) {
        throw StoreError(StoreErrorCode::NoSpaceLeft,
                         "needs " + std::to_string(needed) + " of " +
                         std::to_string(format_.total_capacity()) + " bytes");
    }
}

void TransactionManager::apply_single_remove(uint16_t key) {
    const Location* loc = index_.find(key);
    log_.mark_deleted(*loc);
    index_.remove(key);
    trace() << "transaction: key " << key << " marked deleted in place";
}

void TransactionManager::apply(const std::vector<Operation>& operations) {
    validate(operations);
    std::vector<Operation> ops = reduce(operations);
    if (ops.empty()) {
        return;
    }
    if (ops.size() == 1 && ops[0].is_remove()) {
        apply_single_remove(ops[0].key);
        return;
    }

    std::vector<std::vector<uint8_t>> records;
    std::vector<size_t> sizes;
    records.reserve(ops.size());
    sizes.reserve(ops.size());
    for (size_t i = 0; i < ops.size(); i++) {
        Position position = Position::Standalone;
        if (ops.size() > 1) {
            position = (i == 0) ? Position::Begin
                     : (i + 1 == ops.size()) ? Position::End
                     : Position::Continue;
        }
        const Operation& op = ops[i];
        if (op.is_remove()) {
            records.push_back(format_.encode_entry(op.key, nullptr, 0, EntryKind::Tombstone, position));
        } else {
            records.push_back(format_.encode_entry(op.key, op.value->data(), op.value->size(),
                                                   EntryKind::Value, position));
        }
        sizes.push_back(records.back().size());
    }

    check_capacity(sizes);
    compactor_.ensure_room(sizes);

    std::vector<Location> locations;
    locations.reserve(ops.size());
    for (size_t i = 0; i < ops.size(); i++) {
        const size_t length = ops[i].is_remove() ? 0 : ops[i].value->size();
        locations.push_back(log_.append(records[i], length, false));
    }

    for (size_t i = 0; i < ops.size(); i++) {
        if (ops[i].is_remove()) {
            index_.remove(ops[i].key);
        } else {
            index_.insert(ops[i].key, locations[i]);
        }
    }
    trace() << "transaction: " << ops.size() << " records committed, tail page "
            << log_.tail() << " cursor " << log_.cursor();
}

} // namespace store
} // namespace flashkv
