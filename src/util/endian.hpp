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
#include <cstring>

namespace flashkv {
namespace util {

/**
 * Little-endian helpers for the on-flash layout.
 *
 * Every multi-byte field written to flash is little-endian regardless of
 * the host, so a flash image produced on one machine can be scanned on
 * another.
 */

inline void store_le16(uint8_t* buf, uint16_t val) {
    buf[0] = static_cast<uint8_t>(val);
    buf[1] = static_cast<uint8_t>(val >> 8);
}

inline void store_le32(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>(val);
    buf[1] = static_cast<uint8_t>(val >> 8);
    buf[2] = static_cast<uint8_t>(val >> 16);
    buf[3] = static_cast<uint8_t>(val >> 24);
}

inline uint16_t load_le16(const uint8_t* buf) {
    return static_cast<uint16_t>(buf[0]) |
           (static_cast<uint16_t>(buf[1]) << 8);
}

inline uint32_t load_le32(const uint8_t* buf) {
    return static_cast<uint32_t>(buf[0]) |
           (static_cast<uint32_t>(buf[1]) << 8) |
           (static_cast<uint32_t>(buf[2]) << 16) |
           (static_cast<uint32_t>(buf[3]) << 24);
}

// Unaligned variants for reading straight out of a page buffer
inline uint32_t load_le32_safe(const void* buf) {
    uint8_t bytes[4];
    std::memcpy(bytes, buf, 4);
    return load_le32(bytes);
}

inline void store_le32_safe(void* buf, uint32_t val) {
    uint8_t bytes[4];
    store_le32(bytes, val);
    std::memcpy(buf, bytes, 4);
}

} // namespace util
} // namespace flashkv
