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
#include "store/index.h"

using namespace flashkv::store;

TEST(IndexTest, InsertReplaceRemove) {
    Index index;
    EXPECT_TRUE(index.empty());

    index.insert(5, Location{0, 12, 2, 12});
    index.insert(9, Location{0, 24, 100, 108});
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.live_bytes(), 120u);

    index.insert(5, Location{1, 12, 10, 20});
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.live_bytes(), 128u);
    ASSERT_NE(index.find(5), nullptr);
    EXPECT_EQ(index.find(5)->page, 1u);

    EXPECT_TRUE(index.remove(9));
    EXPECT_FALSE(index.remove(9));
    EXPECT_EQ(index.find(9), nullptr);
    EXPECT_EQ(index.live_bytes(), 20u);

    index.clear();
    EXPECT_EQ(index.size(), 0u);
    EXPECT_EQ(index.live_bytes(), 0u);
}

TEST(IndexTest, KeysAreSorted) {
    Index index;
    for (uint16_t k : {300, 7, 4095, 0, 12}) {
        index.insert(k, Location{0, 12, 0, 8});
    }
    EXPECT_EQ(index.keys(), (std::vector<uint16_t>{0, 7, 12, 300, 4095}));
}

TEST(IndexTest, EntriesOnPageOrderedByOffset) {
    Index index;
    index.insert(1, Location{0, 100, 1, 12});
    index.insert(2, Location{1, 12, 1, 12});
    index.insert(3, Location{0, 12, 1, 12});
    index.insert(4, Location{0, 60, 1, 12});

    auto page0 = index.on_page(0);
    ASSERT_EQ(page0.size(), 3u);
    EXPECT_EQ(page0[0].first, 3);
    EXPECT_EQ(page0[1].first, 4);
    EXPECT_EQ(page0[2].first, 1);
    EXPECT_EQ(index.on_page(1).size(), 1u);
    EXPECT_TRUE(index.on_page(2).empty());
}
