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
#include <cstddef>
#include <optional>
#include <vector>
#include "format.h"
#include "index.h"
#include "log_store.h"
#include "metrics.h"
#include "storage.h"

namespace flashkv {
namespace store {

struct RecoveryResult {
    bool     fresh = false;          // no valid page found, log started empty
    size_t   head = 0;
    size_t   tail = 0;
    uint32_t tail_seq = 0;
    size_t   cursor = 0;
    size_t   entries_scanned = 0;
    size_t   torn_tails = 0;
    size_t   transactions_discarded = 0;
    bool     relocation_resumed = false;  // torn copy of an interrupted compaction completed
};

/**
 * Rebuilds the index and the log position from flash.
 *
 * The tail is the page with the highest sequence; the ring extends backwards
 * while the previous page carries the previous sequence. Entries are replayed
 * from head to tail. Transaction records are buffered until their End record;
 * an unfinished transaction is dropped. An unreadable entry is only tolerated
 * at the very end of the tail page, where it is zero-filled so that later
 * scans skip it. Anything else unreadable is StorageCorrupted.
 *
 * When that torn entry is the copy an interrupted compaction was writing
 * (no free page left, the bytes on flash a prefix of the copy), the copy is
 * completed in place instead, so the compaction resumes without losing
 * room on the reserve page.
 */
class RecoveryScanner {
public:
    RecoveryScanner(Storage& storage, const Format& format, LogStore& log,
                    Index& index, StoreMetrics& metrics);

    RecoveryResult run();

private:
    enum class ScanState { Scanning, InTransaction, Done };

    struct Pending {
        uint16_t key;
        Location location;
        bool     insert;
    };

    struct TornEntry {
        size_t page;
        size_t offset;
        size_t extent;
        std::vector<uint8_t> bytes;  // the whole page as scanned
    };

    std::vector<std::optional<uint32_t>> read_headers() const;
    void apply(const Pending& pending);
    void discard(std::vector<Pending>& buffer, RecoveryResult& result);
    void neutralize(const TornEntry& torn);
    bool resume_relocation(const TornEntry& torn);

    Storage& storage_;
    const Format& format_;
    LogStore& log_;
    Index& index_;
    StoreMetrics& metrics_;
};

} // namespace store
} // namespace flashkv
