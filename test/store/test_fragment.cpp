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
#include <algorithm>
#include <functional>
#include "store/buffer_storage.h"
#include "store/fragment.h"
#include "store/store.h"
#include "store/store_error.h"
#include "test_helpers.h"

using namespace flashkv::store;
using namespace flashkv::store::test;

class FragmentTest : public ::testing::Test {
protected:
    BufferStorage storage{geometry(4, 4096, 16)};
    std::unique_ptr<Store> store;

    void SetUp() override {
        store = Store::open(storage, test_config());
    }
};

TEST_F(FragmentTest, KeyRangePacking) {
    fragment::KeyRange range = fragment::KeyRange::unpack(0x00050002u);
    EXPECT_EQ(range.start, 2u);
    EXPECT_EQ(range.end, 5u);
    EXPECT_EQ(range.size(), 3u);
    EXPECT_EQ(range.pack(), 0x00050002u);
    EXPECT_EQ((fragment::KeyRange{7, 7}).size(), 0u);
}

TEST_F(FragmentTest, LongValueSpansKeys) {
    ASSERT_EQ(store->max_value_length(), 1023u);
    const fragment::KeyRange range{0, 3};
    const auto value = generate_test_data(1500, 9);

    fragment::write(*store, range, value);
    EXPECT_EQ(store->keys(), (std::vector<uint16_t>{0, 1}));
    EXPECT_EQ(store->find(0)->size(), 1023u);
    EXPECT_EQ(store->find(1)->size(), 477u);
    EXPECT_EQ(fragment::read(*store, range), value);

    store.reset();
    store = Store::open(storage, test_config());
    EXPECT_EQ(fragment::read(*store, range), value);
}

TEST_F(FragmentTest, ShorterValueRemovesTrailingKeys) {
    const fragment::KeyRange range{10, 14};
    fragment::write(*store, range, generate_test_data(3000));
    EXPECT_EQ(store->keys(), (std::vector<uint16_t>{10, 11, 12}));

    fragment::write(*store, range, bytes("short"));
    EXPECT_EQ(store->keys(), (std::vector<uint16_t>{10}));
    EXPECT_EQ(fragment::read(*store, range), bytes("short"));
}

TEST_F(FragmentTest, RemoveClearsRange) {
    const fragment::KeyRange range{0, 3};
    store->insert(3, bytes("neighbour"));
    fragment::write(*store, range, generate_test_data(2000));
    fragment::remove(*store, range);

    EXPECT_FALSE(fragment::read(*store, range).has_value());
    EXPECT_EQ(store->keys(), (std::vector<uint16_t>{3}));

    // Nothing left to remove
    const uint64_t records = store->metrics().records_written.value();
    fragment::remove(*store, range);
    EXPECT_EQ(store->metrics().records_written.value(), records);
}

TEST_F(FragmentTest, BadRangesAreRejected) {
    auto code_of = [](const std::function<void()>& fn) {
        try {
            fn();
        } catch (const StoreError& e) {
            return e.code();
        }
        return StoreErrorCode::StorageError;
    };
    EXPECT_EQ(code_of([&] { fragment::write(*store, {5, 5}, bytes("x")); }),
              StoreErrorCode::InvalidArgument);
    EXPECT_EQ(code_of([&] { fragment::write(*store, {0, 1}, generate_test_data(1024)); }),
              StoreErrorCode::InvalidArgument);
    EXPECT_EQ(code_of([&] { fragment::read(*store, {4090, 4097}); }),
              StoreErrorCode::InvalidArgument);
    EXPECT_EQ(code_of([&] { fragment::remove(*store, {3, 1}); }),
              StoreErrorCode::InvalidArgument);
    EXPECT_TRUE(store->keys().empty());
}

TEST_F(FragmentTest, ReadStopsAtFirstGap) {
    store->insert(20, bytes("ab"));
    store->insert(22, bytes("ef"));
    EXPECT_EQ(fragment::read(*store, {20, 23}), bytes("ab"));
    EXPECT_FALSE(fragment::read(*store, {21, 23}).has_value());
}

TEST_F(FragmentTest, WriterAndReaderStream) {
    const fragment::KeyRange range{100, 103};
    const auto value = generate_test_data(2500, 3);

    fragment::FragmentWriter writer(*store, range);
    for (size_t off = 0; off < value.size(); off += 700) {
        const size_t n = std::min<size_t>(700, value.size() - off);
        writer.write(value.data() + off, n);
    }
    EXPECT_EQ(writer.position(), value.size());
    EXPECT_FALSE(store->find(100).has_value());
    writer.commit();

    fragment::FragmentReader reader(*store, range);
    ASSERT_TRUE(reader.found());
    EXPECT_EQ(reader.size(), value.size());

    std::vector<uint8_t> out(value.size());
    size_t got = 0;
    while (got < out.size()) {
        const size_t n = reader.read(out.data() + got, 333);
        ASSERT_GT(n, 0u);
        got += n;
    }
    EXPECT_EQ(out, value);
    EXPECT_EQ(reader.read(out.data(), 10), 0u);

    reader.seek(2000);
    uint8_t byte = 0;
    EXPECT_EQ(reader.read(&byte, 1), 1u);
    EXPECT_EQ(byte, value[2000]);
    EXPECT_THROW(reader.seek(2501), StoreError);

    fragment::FragmentWriter small(*store, {200, 201});
    EXPECT_THROW(small.write(generate_test_data(1024)), StoreError);
    EXPECT_EQ(small.position(), 0u);
}

TEST_F(FragmentTest, MissingValueReadsAsNotFound) {
    fragment::FragmentReader reader(*store, {300, 302});
    EXPECT_FALSE(reader.found());
    EXPECT_EQ(reader.size(), 0u);
    uint8_t byte = 0;
    EXPECT_EQ(reader.read(&byte, 1), 0u);
}
