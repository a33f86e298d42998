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

namespace flashkv {
namespace store {

// On-flash layout constants
namespace format {
    constexpr uint16_t kPageMagic = 0x4B46;        // "FK"
    constexpr uint8_t  kFormatVersion = 1;
    // magic(2) version(1) flags(1) sequence(4) crc32c(4), padded to a word
    constexpr size_t   kPageHeaderBytes = 12;

    // One header word per fragment, checksum after the last fragment's payload
    constexpr size_t   kFragmentHeaderBytes = 4;
    constexpr size_t   kChecksumBytes = 4;
    constexpr size_t   kMaxFragmentPayload = 255;  // 8-bit length field
    constexpr size_t   kMaxFragments = 16;         // 4-bit remaining field
}

// Caller-visible limits, enforced as InvalidArgument
namespace limits {
    constexpr uint16_t kMaxKey = 4095;             // 12-bit key field
    constexpr size_t   kMaxValueLength = 1023;
    constexpr size_t   kMinPages = 2;              // one in use, one reserved
    constexpr size_t   kMinWordWrites = 2;         // deletion marks need a second write
    constexpr size_t   kMinWordSize = 4;
    constexpr size_t   kMaxWordSize = 64;
    constexpr size_t   kMaxPageSize = 1u << 20;
}

namespace compaction {
    // Compactions one operation may trigger, per page of the ring
    constexpr size_t kMaxRoundsPerPage = 2;
}

} // namespace store
} // namespace flashkv
