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
#include <atomic>
#include <cstdint>
#include <string>

namespace flashkv {
namespace store {

// Counter - monotonically increasing value
class Counter {
public:
    explicit Counter(const std::string& name) : name_(name), value_(0) {}

    const std::string& name() const { return name_; }
    void reset() { value_.store(0); }

    void increment(uint64_t delta = 1) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    uint64_t value() const {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::atomic<uint64_t> value_;
};

// Per-session counters of one store instance
struct StoreMetrics {
    Counter records_written{"records_written"};
    Counter bytes_written{"bytes_written"};
    Counter compactions{"compactions"};
    Counter page_erases{"page_erases"};
    Counter torn_tails{"torn_tails"};
    Counter recoveries{"recoveries"};
    Counter transactions_discarded{"transactions_discarded"};

    void reset() {
        records_written.reset();
        bytes_written.reset();
        compactions.reset();
        page_erases.reset();
        torn_tails.reset();
        recoveries.reset();
        transactions_discarded.reset();
    }

    // One line, "name=value" pairs, for logging
    std::string summary() const {
        std::string out;
        for (const Counter* c : {&records_written, &bytes_written, &compactions, &page_erases,
                                 &torn_tails, &recoveries, &transactions_discarded}) {
            if (!out.empty()) out += ' ';
            out += c->name() + "=" + std::to_string(c->value());
        }
        return out;
    }
};

} // namespace store
} // namespace flashkv
