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

#include "recovery.h"
#include "store_error.h"
#include "../util/log.h"
#include <algorithm>
#include <string>

namespace flashkv {
namespace store {

RecoveryScanner::RecoveryScanner(Storage& storage, const Format& format, LogStore& log,
                                 Index& index, StoreMetrics& metrics)
    : storage_(storage), format_(format), log_(log), index_(index), metrics_(metrics) {}

std::vector<std::optional<uint32_t>> RecoveryScanner::read_headers() const {
    std::vector<std::optional<uint32_t>> seqs(format_.num_pages());
    for (size_t p = 0; p < format_.num_pages(); p++) {
        std::vector<uint8_t> header = storage_.read_slice(StorageIndex{p, 0}, format_.page_header_size());
        seqs[p] = format_.decode_page_header(header.data(), header.size());
    }
    return seqs;
}

void RecoveryScanner::apply(const Pending& pending) {
    if (pending.insert) {
        index_.insert(pending.key, pending.location);
    } else {
        index_.remove(pending.key);
    }
}

void RecoveryScanner::discard(std::vector<Pending>& buffer, RecoveryResult& result) {
    if (buffer.empty()) {
        return;
    }
    debug() << "recovery: dropping unfinished transaction of " << buffer.size() << " records";
    buffer.clear();
    result.transactions_discarded++;
    metrics_.transactions_discarded.increment();
}

void RecoveryScanner::neutralize(const TornEntry& torn) {
    const size_t w = format_.word_size();
    const std::vector<uint8_t> zero(w, 0);
    for (size_t off = torn.offset; off < torn.offset + torn.extent; off += w) {
        if (!format_.is_padding_word(torn.bytes.data() + off)) {
            storage_.write_slice(StorageIndex{torn.page, off}, zero);
        }
    }
}

bool RecoveryScanner::resume_relocation(const TornEntry& torn) {
    if (log_.free_pages() != 0 || log_.head() == log_.tail() || torn.page != log_.tail()) {
        return false;
    }

    // Copies run in offset order: the first entry still live on the head
    // page is the one that was being copied
    auto live = index_.on_page(log_.head());
    if (live.empty()) {
        return false;
    }
    const uint16_t key = live.front().first;
    std::vector<uint8_t> original = log_.read(live.front().second);
    Decoded d = format_.decode_entry(original.data(), original.size());
    if (d.status != DecodeStatus::Valid || d.entry.key != key) {
        return false;
    }
    std::vector<uint8_t> copy = format_.encode_entry(key, d.entry.value.data(), d.entry.value.size(),
                                                     EntryKind::Value, Position::Standalone);
    // A copy cut between fragments reads shorter than the whole entry
    if (copy.size() < torn.extent || torn.offset + copy.size() > torn.bytes.size()) {
        return false;
    }

    const uint8_t* flash = torn.bytes.data() + torn.offset;
    for (size_t i = 0; i < copy.size(); i++) {
        if ((flash[i] & copy[i]) != copy[i]) {
            return false;
        }
    }

    // Words already holding their final value are not written again
    const size_t w = format_.word_size();
    for (size_t off = 0; off < copy.size(); off += w) {
        if (!std::equal(copy.begin() + off, copy.begin() + off + w, flash + off)) {
            storage_.write_slice(StorageIndex{torn.page, torn.offset + off}, copy.data() + off, w);
        }
    }

    std::vector<uint8_t> check = storage_.read_slice(StorageIndex{torn.page, torn.offset}, copy.size());
    Decoded v = format_.decode_entry(check.data(), check.size());
    if (v.status != DecodeStatus::Valid || v.entry.key != key || v.entry.value != d.entry.value) {
        throw StoreError(StoreErrorCode::StorageCorrupted,
                         "resumed copy of key " + std::to_string(key) + " on page " +
                         std::to_string(torn.page) + " did not verify");
    }
    index_.insert(key, Location{torn.page, torn.offset, d.entry.value.size(), copy.size()});
    log_.restore(log_.head(), log_.tail(), log_.tail_seq(), torn.offset + copy.size());
    info() << "recovery: resumed interrupted relocation of key " << key << " on page "
           << torn.page << " at offset " << torn.offset;
    return true;
}

RecoveryResult RecoveryScanner::run() {
    RecoveryResult result;
    const size_t n = format_.num_pages();
    const size_t page_size = format_.page_size();
    const size_t w = format_.word_size();

    index_.clear();
    metrics_.recoveries.increment();

    std::vector<std::optional<uint32_t>> seqs = read_headers();

    std::optional<size_t> tail;
    for (size_t p = 0; p < n; p++) {
        if (seqs[p] && (!tail || *seqs[p] > *seqs[*tail])) {
            tail = p;
        }
    }
    if (!tail) {
        info() << "recovery: no valid page, starting empty log";
        log_.start_fresh();
        result.fresh = true;
        result.tail_seq = log_.tail_seq();
        result.cursor = log_.cursor();
        return result;
    }

    size_t head = *tail;
    for (size_t count = 1; count < n; count++) {
        const size_t prev = (head + n - 1) % n;
        if (!seqs[prev] || *seqs[prev] + 1 != *seqs[head]) {
            break;
        }
        head = prev;
    }

    result.head = head;
    result.tail = *tail;
    result.tail_seq = *seqs[*tail];
    result.cursor = page_size;

    ScanState state = ScanState::Scanning;
    std::vector<Pending> buffer;
    std::optional<TornEntry> torn;

    for (size_t p = head; state != ScanState::Done; p = log_.next_page(p)) {
        const bool is_tail = (p == *tail);
        std::vector<uint8_t> bytes = storage_.read_slice(StorageIndex{p, 0}, page_size);
        size_t off = format_.page_header_size();
        bool page_done = false;

        while (off < page_size && !page_done) {
            Decoded d = format_.decode_entry(bytes.data() + off, page_size - off);
            switch (d.status) {
                case DecodeStatus::Valid: {
                    result.entries_scanned++;
                    Pending item;
                    item.key = d.entry.key;
                    item.location = Location{p, off, d.entry.value.size(), d.extent};
                    item.insert = d.entry.kind == EntryKind::Value && d.entry.live;

                    switch (d.entry.position) {
                        case Position::Standalone:
                            discard(buffer, result);
                            apply(item);
                            state = ScanState::Scanning;
                            break;
                        case Position::Begin:
                            discard(buffer, result);
                            buffer.push_back(item);
                            state = ScanState::InTransaction;
                            break;
                        case Position::Continue:
                            if (state == ScanState::Scanning) {
                                trace() << "recovery: transaction started before page " << p;
                            }
                            buffer.push_back(item);
                            state = ScanState::InTransaction;
                            break;
                        case Position::End:
                            buffer.push_back(item);
                            for (const auto& pending : buffer) {
                                apply(pending);
                            }
                            buffer.clear();
                            state = ScanState::Scanning;
                            break;
                    }
                    off += d.extent;
                    break;
                }

                case DecodeStatus::Padding:
                    off += w;
                    break;

                case DecodeStatus::Erased:
                    if (!is_erased(bytes.data() + off, page_size - off)) {
                        throw StoreError(StoreErrorCode::StorageCorrupted,
                                         "page " + std::to_string(p) + ": data after erased word at offset " +
                                         std::to_string(off));
                    }
                    if (is_tail) {
                        result.cursor = off;
                    }
                    page_done = true;
                    break;

                case DecodeStatus::Invalid: {
                    const size_t end = off + d.extent;
                    if (!is_tail || !is_erased(bytes.data() + end, page_size - end)) {
                        throw StoreError(StoreErrorCode::StorageCorrupted,
                                         "page " + std::to_string(p) + ": invalid entry at offset " +
                                         std::to_string(off));
                    }
                    torn = TornEntry{p, off, d.extent, bytes};
                    discard(buffer, result);
                    result.cursor = end;
                    page_done = true;
                    break;
                }
            }
        }

        if (is_tail) {
            state = ScanState::Done;
        }
    }

    discard(buffer, result);
    log_.restore(result.head, result.tail, result.tail_seq, result.cursor);

    if (torn) {
        if (resume_relocation(*torn)) {
            result.relocation_resumed = true;
            result.cursor = log_.cursor();
        } else {
            warning() << "recovery: discarding torn entry on page " << torn->page << " at offset "
                      << torn->offset << " (" << torn->extent << " bytes)";
            neutralize(*torn);
            result.torn_tails++;
            metrics_.torn_tails.increment();
        }
    }

    info() << "recovery: pages " << result.head << ".." << result.tail << " (seq " << result.tail_seq
           << "), " << index_.size() << " keys, cursor " << result.cursor;
    return result;
}

} // namespace store
} // namespace flashkv
