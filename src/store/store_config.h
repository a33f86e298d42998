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
#include <cstdlib>
#include <string>
#include "config.h"

namespace flashkv {
namespace store {

/**
 * Runtime configuration of a store instance.
 * Geometry comes from the driver; these are the policy knobs on top.
 */
struct StoreConfig {
    // Upper bound on value length; further capped by what fits in one page
    size_t max_value_length    = limits::kMaxValueLength;

    // Compactions a single mutation may run before giving up with
    // NoSpaceLeft. 0 means kMaxRoundsPerPage * num_pages.
    size_t max_compactions     = 0;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StoreConfig defaults() {
        StoreConfig cfg;

        if (const char* env = std::getenv("FLASHKV_MAX_VALUE_LENGTH")) {
            cfg.max_value_length = std::stoull(env);
        }

        if (const char* env = std::getenv("FLASHKV_MAX_COMPACTIONS")) {
            cfg.max_compactions = std::stoull(env);
        }

        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (max_value_length == 0 || max_value_length > limits::kMaxValueLength) {
            return false;
        }
        return true;
    }
};

} // namespace store
} // namespace flashkv
