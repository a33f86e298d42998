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
#include <stdexcept>
#include <string>

namespace flashkv {
namespace store {

enum class StoreErrorCode {
    InvalidArgument,   // key out of range, value too long, bad geometry
    NoSpaceLeft,       // does not fit even after compaction
    StorageError,      // driver reported a read/write/erase fault
    StorageCorrupted,  // checksum failure not at the tail; fatal until clear()
    OutOfBounds        // address outside the driver geometry
};

const char* to_string(StoreErrorCode code);

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrorCode code, const std::string& what)
        : std::runtime_error(std::string(to_string(code)) + ": " + what), code_(code) {}

    StoreErrorCode code() const noexcept { return code_; }

private:
    StoreErrorCode code_;
};

} // namespace store
} // namespace flashkv
