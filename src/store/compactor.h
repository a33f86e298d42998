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
#include <cstddef>
#include <vector>
#include "format.h"
#include "index.h"
#include "log_store.h"
#include "metrics.h"
#include "store_config.h"

namespace flashkv {
namespace store {

/**
 * Reclaims the head page of the ring.
 *
 * Live entries of the head page are copied to the tail as standalone values,
 * then the head page is erased. Deleted entries and tombstones are dropped:
 * pages are erased in ring order, so no older copy of their key survives
 * them. The live entries of one page always fit in the reserve page.
 */
class Compactor {
public:
    Compactor(const Format& format, LogStore& log, Index& index,
              StoreMetrics& metrics, const StoreConfig& config);

    // Compacts until entries of these sizes can be appended without the
    // reserve page. Throws NoSpaceLeft when the compaction budget runs out.
    void ensure_room(const std::vector<size_t>& sizes);

    // Relocates the head page and erases it
    void compact_once();

    size_t max_compactions() const;

private:
    const Format& format_;
    LogStore& log_;
    Index& index_;
    StoreMetrics& metrics_;
    const StoreConfig& config_;
};

} // namespace store
} // namespace flashkv
