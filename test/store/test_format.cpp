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
#include "store/format.h"
#include "store/store_error.h"
#include "test_helpers.h"
#include <cstring>

using namespace flashkv::store;
using namespace flashkv::store::test;

namespace {

Geometry make_geometry(size_t word, size_t page, size_t pages, size_t writes = 2) {
    Geometry g;
    g.word_size = word;
    g.page_size = page;
    g.num_pages = pages;
    g.max_word_writes = writes;
    g.max_page_erases = 10000;
    return g;
}

StoreErrorCode error_of(const Geometry& g) {
    try {
        Format f(g);
    } catch (const StoreError& e) {
        return e.code();
    }
    ADD_FAILURE() << "geometry accepted";
    return StoreErrorCode::OutOfBounds;
}

} // namespace

class FormatTest : public ::testing::Test {
protected:
    Format tiny{make_geometry(4, 256, 2)};
    Format host{make_geometry(4, 4096, 16)};
};

TEST_F(FormatTest, TinyGeometryLimits) {
    EXPECT_EQ(tiny.page_header_size(), 12u);
    EXPECT_EQ(tiny.page_capacity(), 244u);
    EXPECT_EQ(tiny.max_value_length(), 236u);
    EXPECT_EQ(tiny.entry_size(236), 244u);
    EXPECT_EQ(tiny.total_capacity(), 244u);
}

TEST_F(FormatTest, HostGeometryLimits) {
    EXPECT_EQ(host.max_value_length(), 1023u);
    EXPECT_EQ(host.entry_size(1023), 1052u);
    EXPECT_EQ(host.fragment_count(1023), 5u);
    EXPECT_EQ(host.entry_size(0), 8u);
    EXPECT_EQ(host.entry_size(2), 12u);
    EXPECT_EQ(host.entry_size(255), 264u);
    EXPECT_EQ(host.entry_size(256), 260u + 12u);
    EXPECT_EQ(host.total_capacity(), 15u * 4084u - 14u * (1052u - 4u));
}

TEST_F(FormatTest, ConfiguredValueLimitIsCapped) {
    Format f(make_geometry(4, 4096, 4), 100);
    EXPECT_EQ(f.max_value_length(), 100u);
    EXPECT_THROW(Format(make_geometry(4, 4096, 4), 0), StoreError);
    EXPECT_THROW(Format(make_geometry(4, 4096, 4), 1024), StoreError);
}

TEST_F(FormatTest, RejectsBadGeometry) {
    EXPECT_EQ(error_of(make_geometry(4, 256, 1)), StoreErrorCode::InvalidArgument);
    EXPECT_EQ(error_of(make_geometry(0, 0, 0)), StoreErrorCode::InvalidArgument);
    EXPECT_EQ(error_of(make_geometry(3, 255, 2)), StoreErrorCode::InvalidArgument);
    EXPECT_EQ(error_of(make_geometry(128, 1024, 2)), StoreErrorCode::InvalidArgument);
    EXPECT_EQ(error_of(make_geometry(4, 258, 2)), StoreErrorCode::InvalidArgument);
    EXPECT_EQ(error_of(make_geometry(4, 256, 2, 1)), StoreErrorCode::InvalidArgument);
    EXPECT_EQ(error_of(make_geometry(4, 16, 2)), StoreErrorCode::InvalidArgument);
}

TEST_F(FormatTest, HeaderWordLayout) {
    FragmentHeader h;
    h.key = 0xABC;
    h.length = 0x12;
    h.remaining = 3;
    h.kind = EntryKind::Tombstone;
    h.position = Position::End;
    h.live = true;

    const uint32_t word = h.pack();
    EXPECT_EQ(word & 0xFFFu, 0xABCu);
    EXPECT_EQ((word >> 12) & 0xFFu, 0x12u);
    EXPECT_EQ((word >> 22) & 0xFu, 3u);
    EXPECT_EQ((word >> 26) & 1u, 1u);
    EXPECT_EQ((word >> 27) & 3u, 3u);
    EXPECT_EQ(word & FragmentHeader::kPresentBit, 0u);
    EXPECT_NE(word & FragmentHeader::kLiveBit, 0u);

    auto back = FragmentHeader::unpack(word);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->key, 0xABC);
    EXPECT_EQ(back->position, Position::End);
    EXPECT_EQ(back->kind, EntryKind::Tombstone);

    EXPECT_FALSE(FragmentHeader::unpack(0xFFFFFFFFu).has_value());
    EXPECT_FALSE(FragmentHeader::unpack(word & ~(1u << 29)).has_value());
}

TEST_F(FormatTest, EncodeDecodeValue) {
    auto value = bytes("ab");
    auto encoded = tiny.encode_entry(7, value.data(), value.size(), EntryKind::Value, Position::Standalone);
    ASSERT_EQ(encoded.size(), 12u);

    Decoded d = tiny.decode_entry(encoded.data(), encoded.size());
    ASSERT_EQ(d.status, DecodeStatus::Valid);
    EXPECT_EQ(d.extent, 12u);
    EXPECT_EQ(d.entry.key, 7);
    EXPECT_EQ(d.entry.kind, EntryKind::Value);
    EXPECT_EQ(d.entry.position, Position::Standalone);
    EXPECT_TRUE(d.entry.live);
    EXPECT_EQ(d.entry.value, value);
}

TEST_F(FormatTest, PaddingBytesAreErased) {
    auto value = bytes("a");
    auto encoded = tiny.encode_entry(1, value.data(), value.size(), EntryKind::Value, Position::Standalone);
    // header(4) 'a' then three pad bytes before the checksum
    EXPECT_EQ(encoded[5], 0xFF);
    EXPECT_EQ(encoded[6], 0xFF);
    EXPECT_EQ(encoded[7], 0xFF);
}

TEST_F(FormatTest, MultiFragmentValue) {
    auto value = generate_test_data(600, 9);
    auto encoded = host.encode_entry(42, value.data(), value.size(), EntryKind::Value, Position::Begin);
    EXPECT_EQ(host.fragment_count(600), 3u);
    EXPECT_EQ(encoded.size(), host.entry_size(600));

    Decoded d = host.decode_entry(encoded.data(), encoded.size());
    ASSERT_EQ(d.status, DecodeStatus::Valid);
    EXPECT_EQ(d.entry.key, 42);
    EXPECT_EQ(d.entry.position, Position::Begin);
    EXPECT_EQ(d.entry.value, value);
}

TEST_F(FormatTest, TombstoneHasNoPayload) {
    auto encoded = tiny.encode_entry(5, nullptr, 0, EntryKind::Tombstone, Position::End);
    EXPECT_EQ(encoded.size(), 8u);
    Decoded d = tiny.decode_entry(encoded.data(), encoded.size());
    ASSERT_EQ(d.status, DecodeStatus::Valid);
    EXPECT_EQ(d.entry.kind, EntryKind::Tombstone);
    EXPECT_TRUE(d.entry.value.empty());
}

TEST_F(FormatTest, DeletionMarkKeepsChecksumValid) {
    auto value = bytes("cd");
    auto encoded = tiny.encode_entry(2, value.data(), value.size(), EntryKind::Value, Position::Standalone);
    auto mark = tiny.deletion_mark(encoded.data());
    ASSERT_EQ(mark.size(), 4u);
    std::memcpy(encoded.data(), mark.data(), mark.size());

    Decoded d = tiny.decode_entry(encoded.data(), encoded.size());
    ASSERT_EQ(d.status, DecodeStatus::Valid);
    EXPECT_FALSE(d.entry.live);
    EXPECT_EQ(d.entry.value, value);
}

TEST_F(FormatTest, CorruptPayloadIsInvalid) {
    auto value = generate_test_data(40);
    auto encoded = tiny.encode_entry(3, value.data(), value.size(), EntryKind::Value, Position::Standalone);
    encoded[10] ^= 0x01;
    Decoded d = tiny.decode_entry(encoded.data(), encoded.size());
    EXPECT_EQ(d.status, DecodeStatus::Invalid);
    EXPECT_EQ(d.extent, encoded.size());
}

TEST_F(FormatTest, TornEntryIsInvalid) {
    auto value = generate_test_data(300);
    auto encoded = host.encode_entry(3, value.data(), value.size(), EntryKind::Value, Position::Standalone);

    // Second fragment never written
    std::vector<uint8_t> torn(encoded.size() + 64, 0xFF);
    std::memcpy(torn.data(), encoded.data(), 260);
    Decoded d = host.decode_entry(torn.data(), torn.size());
    EXPECT_EQ(d.status, DecodeStatus::Invalid);
    EXPECT_EQ(d.extent, 260u);

    // Checksum never written
    std::memcpy(torn.data(), encoded.data(), encoded.size() - 4);
    d = host.decode_entry(torn.data(), torn.size());
    EXPECT_EQ(d.status, DecodeStatus::Invalid);
    EXPECT_EQ(d.extent, encoded.size());
}

TEST_F(FormatTest, EntryExtendingPastPageIsInvalid) {
    auto value = generate_test_data(100);
    auto encoded = tiny.encode_entry(3, value.data(), value.size(), EntryKind::Value, Position::Standalone);
    Decoded d = tiny.decode_entry(encoded.data(), 40);
    EXPECT_EQ(d.status, DecodeStatus::Invalid);
    EXPECT_EQ(d.extent, 4u);
}

TEST_F(FormatTest, ErasedAndPadding) {
    std::vector<uint8_t> erased(16, 0xFF);
    EXPECT_EQ(tiny.decode_entry(erased.data(), erased.size()).status, DecodeStatus::Erased);
    EXPECT_EQ(tiny.decode_entry(erased.data(), 2).status, DecodeStatus::Erased);

    std::vector<uint8_t> zero(16, 0);
    Decoded d = tiny.decode_entry(zero.data(), zero.size());
    EXPECT_EQ(d.status, DecodeStatus::Padding);
    EXPECT_EQ(d.extent, 4u);
}

TEST_F(FormatTest, PageHeaderRoundTrip) {
    auto header = tiny.encode_page_header(77);
    ASSERT_EQ(header.size(), 12u);
    auto seq = tiny.decode_page_header(header.data(), header.size());
    ASSERT_TRUE(seq.has_value());
    EXPECT_EQ(*seq, 77u);

    header[5] ^= 0x10;
    EXPECT_FALSE(tiny.decode_page_header(header.data(), header.size()).has_value());

    std::vector<uint8_t> erased(12, 0xFF);
    EXPECT_FALSE(tiny.decode_page_header(erased.data(), erased.size()).has_value());
}

TEST_F(FormatTest, WideWordsPadHeaderAndEntries) {
    Format wide(make_geometry(8, 512, 2));
    EXPECT_EQ(wide.page_header_size(), 16u);
    EXPECT_EQ(wide.encode_page_header(1).size(), 16u);
    EXPECT_EQ(wide.entry_size(2), 16u);

    auto value = bytes("xyz");
    auto encoded = wide.encode_entry(9, value.data(), value.size(), EntryKind::Value, Position::Standalone);
    EXPECT_EQ(encoded.size(), 16u);
    auto mark = wide.deletion_mark(encoded.data());
    EXPECT_EQ(mark.size(), 8u);
    Decoded d = wide.decode_entry(encoded.data(), encoded.size());
    ASSERT_EQ(d.status, DecodeStatus::Valid);
    EXPECT_EQ(d.entry.value, value);
}

TEST_F(FormatTest, EncodeRejectsOutOfRange) {
    auto value = generate_test_data(237);
    EXPECT_THROW(tiny.encode_entry(4096, value.data(), 1, EntryKind::Value, Position::Standalone), StoreError);
    EXPECT_THROW(tiny.encode_entry(1, value.data(), 237, EntryKind::Value, Position::Standalone), StoreError);
}
