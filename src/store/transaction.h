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
#include <optional>
#include <utility>
#include <vector>
#include "compactor.h"
#include "format.h"
#include "index.h"
#include "log_store.h"

namespace flashkv {
namespace store {

// One mutation of a transaction: an insert when value is set, else a remove
struct Operation {
    uint16_t key = 0;
    std::optional<std::vector<uint8_t>> value;

    static Operation insert(uint16_t key, std::vector<uint8_t> value) {
        Operation op;
        op.key = key;
        op.value = std::move(value);
        return op;
    }

    static Operation remove(uint16_t key) {
        Operation op;
        op.key = key;
        return op;
    }

    bool is_remove() const { return !value.has_value(); }
};

/**
 * Applies a list of operations atomically.
 *
 * Operations are validated, reduced to the last one per key, checked against
 * the capacity (live bytes plus the new records), given room by compaction,
 * and appended. The index is updated only once every record is on flash.
 */
class TransactionManager {
public:
    TransactionManager(const Format& format, LogStore& log, Index& index, Compactor& compactor);

    void apply(const std::vector<Operation>& operations);

    // Throws InvalidArgument for a key or value outside the limits
    void validate(const std::vector<Operation>& operations) const;

    // Last operation per key, in order of final occurrence; removes of
    // absent keys dropped
    std::vector<Operation> reduce(const std::vector<Operation>& operations) const;

private:
    void apply_single_remove(uint16_t key);
    void check_capacity(const std::vector<size_t>& sizes) const;

    const Format& format_;
    LogStore& log_;
    Index& index_;
    Compactor& compactor_;
};

} // namespace store
} // namespace flashkv
