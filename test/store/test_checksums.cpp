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

#include <gtest/gtest.h>
#include "store/checksums.h"
#include <cstring>
#include <string>
#include <vector>

using namespace flashkv::store;

TEST(ChecksumsTest, CRC32CKnownVector) {
    const char* check = "123456789";
    EXPECT_EQ(CRC32C::compute(check, std::strlen(check)), 0xE3069283u);
    EXPECT_EQ(crc32c(check, std::strlen(check)), 0xE3069283u);
}

TEST(ChecksumsTest, CRC32CEmptyInput) {
    EXPECT_EQ(CRC32C::compute(nullptr, 0), 0u);
}

TEST(ChecksumsTest, IncrementalMatchesOneShot) {
    std::vector<uint8_t> data(1000);
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = static_cast<uint8_t>(i * 7 + 3);
    }

    CRC32C crc;
    crc.update(data.data(), 1);
    crc.update(data.data() + 1, 14);
    crc.update(data.data() + 15, data.size() - 15);
    EXPECT_EQ(crc.finalize(), CRC32C::compute(data));

    crc.reset();
    crc.update(data);
    EXPECT_EQ(crc.finalize(), CRC32C::compute(data));
}

TEST(ChecksumsTest, DetectsSingleBitFlip) {
    std::vector<uint8_t> data(64, 0x5A);
    const uint32_t before = CRC32C::compute(data);
    data[17] ^= 0x04;
    EXPECT_NE(CRC32C::compute(data), before);
}
