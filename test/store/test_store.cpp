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

// store.h comes first and alone: it must carry StoreError for its callers
#include "store/store.h"
#include <gtest/gtest.h>
#include <cstdlib>
#include "store/buffer_storage.h"
#include "test_helpers.h"

using namespace flashkv::store;
using namespace flashkv::store::test;

class StoreTest : public ::testing::Test {
protected:
    BufferStorage storage{geometry(4, 2048, 4)};
    std::unique_ptr<Store> store;

    void SetUp() override {
        store = Store::open(storage, test_config());
    }

    void reopen() {
        store.reset();
        store = Store::open(storage, test_config());
    }

    StoreErrorCode code_of(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const StoreError& e) {
            return e.code();
        }
        ADD_FAILURE() << "no error thrown";
        return StoreErrorCode::OutOfBounds;
    }
};

TEST_F(StoreTest, EmptyStore) {
    EXPECT_FALSE(store->find(0).has_value());
    EXPECT_EQ(store->used(), 0u);
    EXPECT_GT(store->capacity(), 0u);
    EXPECT_TRUE(store->keys().empty());
    EXPECT_FALSE(store->corrupted());
}

TEST_F(StoreTest, InsertFindRoundTrip) {
    store->insert(1, bytes("hello"));
    store->insert(4095, generate_test_data(store->max_value_length()));
    const uint8_t raw[] = {1, 2, 3};
    store->insert(77, raw, sizeof(raw));

    EXPECT_EQ(store->find(1), bytes("hello"));
    EXPECT_EQ(store->find(4095), generate_test_data(store->max_value_length()));
    EXPECT_EQ(store->find(77), (std::vector<uint8_t>{1, 2, 3}));

    reopen();
    EXPECT_EQ(store->find(1), bytes("hello"));
    EXPECT_EQ(store->keys(), (std::vector<uint16_t>{1, 77, 4095}));
}

TEST_F(StoreTest, EmptyValueIsPresent) {
    store->insert(3, std::vector<uint8_t>());
    auto value = store->find(3);
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->empty());
}

TEST_F(StoreTest, OverwriteKeepsLatest) {
    for (int i = 0; i < 20; i++) {
        store->insert(9, bytes("v" + std::to_string(i)));
    }
    EXPECT_EQ(store->find(9), bytes("v19"));
    EXPECT_EQ(store->used(), store->format().entry_size(3));
    reopen();
    EXPECT_EQ(store->find(9), bytes("v19"));
}

TEST_F(StoreTest, RemoveIsIdempotent) {
    store->insert(5, bytes("x"));
    store->remove(5);
    EXPECT_FALSE(store->find(5).has_value());
    const size_t writes = storage.total_word_writes();
    store->remove(5);
    store->remove(6);
    EXPECT_EQ(storage.total_word_writes(), writes);
    reopen();
    EXPECT_FALSE(store->find(5).has_value());
}

TEST_F(StoreTest, RejectsInvalidArguments) {
    EXPECT_EQ(code_of([&] { store->insert(4096, bytes("x")); }), StoreErrorCode::InvalidArgument);
    EXPECT_EQ(code_of([&] { store->find(4096); }), StoreErrorCode::InvalidArgument);
    EXPECT_EQ(code_of([&] { store->insert(1, generate_test_data(store->max_value_length() + 1)); }),
              StoreErrorCode::InvalidArgument);
    EXPECT_EQ(code_of([&] {
                  store->transaction({Operation::insert(1, bytes("a")), Operation::remove(5000)});
              }),
              StoreErrorCode::InvalidArgument);
    EXPECT_FALSE(store->find(1).has_value());
    EXPECT_FALSE(store->corrupted());
}

TEST_F(StoreTest, UsedTracksLiveEntries) {
    const Format& f = store->format();
    store->insert(1, generate_test_data(10));
    store->insert(2, generate_test_data(300));
    EXPECT_EQ(store->used(), f.entry_size(10) + f.entry_size(300));
    store->remove(1);
    EXPECT_EQ(store->used(), f.entry_size(300));
    reopen();
    EXPECT_EQ(store->used(), f.entry_size(300));
}

TEST_F(StoreTest, ClearFromRemovesUpperKeys) {
    for (uint16_t k : {1, 10, 20, 30, 40}) {
        store->insert(k, bytes("k"));
    }
    store->clear_from(20);
    EXPECT_EQ(store->keys(), (std::vector<uint16_t>{1, 10}));
    reopen();
    EXPECT_EQ(store->keys(), (std::vector<uint16_t>{1, 10}));
}

TEST_F(StoreTest, ClearErasesEverything) {
    store->insert(1, bytes("a"));
    store->insert(2, bytes("b"));
    store->clear();
    EXPECT_TRUE(store->keys().empty());
    EXPECT_EQ(store->used(), 0u);

    reopen();
    EXPECT_TRUE(store->keys().empty());
    store->insert(3, bytes("c"));
    EXPECT_EQ(store->find(3), bytes("c"));
}

TEST_F(StoreTest, RejectsWordsWithSingleWrite) {
    BufferOptions opts = geometry(4, 256, 2);
    opts.max_word_writes = 1;
    BufferStorage once(opts);
    EXPECT_EQ(code_of([&] { Store::open(once, test_config()); }), StoreErrorCode::InvalidArgument);
}

TEST_F(StoreTest, OpensOnWideWords) {
    BufferStorage wide(geometry(8, 512, 3));
    auto s = Store::open(wide, test_config());
    s->insert(1, bytes("wide"));
    s->transaction({Operation::insert(2, bytes("a")), Operation::insert(3, bytes("b"))});
    s->remove(1);
    s.reset();
    s = Store::open(wide, test_config());
    EXPECT_FALSE(s->find(1).has_value());
    EXPECT_EQ(s->find(2), bytes("a"));
    EXPECT_EQ(s->find(3), bytes("b"));
}

TEST_F(StoreTest, MetricsCountWrites) {
    store->insert(1, bytes("a"));
    store->insert(2, bytes("b"));
    EXPECT_EQ(store->metrics().records_written.value(), 2u);
    EXPECT_EQ(store->metrics().recoveries.value(), 1u);
    EXPECT_NE(store->metrics().summary().find("records_written=2"), std::string::npos);
}

TEST(StoreConfigTest, DefaultsReadEnvironment) {
    setenv("FLASHKV_MAX_VALUE_LENGTH", "200", 1);
    setenv("FLASHKV_MAX_COMPACTIONS", "7", 1);
    StoreConfig cfg = StoreConfig::defaults();
    unsetenv("FLASHKV_MAX_VALUE_LENGTH");
    unsetenv("FLASHKV_MAX_COMPACTIONS");

    EXPECT_EQ(cfg.max_value_length, 200u);
    EXPECT_EQ(cfg.max_compactions, 7u);
    EXPECT_TRUE(cfg.validate());

    BufferStorage storage(geometry(4, 2048, 4));
    auto store = Store::open(storage, cfg);
    EXPECT_EQ(store->max_value_length(), 200u);
    EXPECT_THROW(store->insert(1, generate_test_data(201)), StoreError);
}

TEST(StoreConfigTest, InvalidConfigIsRejected) {
    StoreConfig cfg;
    cfg.max_value_length = 0;
    EXPECT_FALSE(cfg.validate());
    BufferStorage storage(tiny_geometry());
    EXPECT_THROW(Store::open(storage, cfg), StoreError);
}
