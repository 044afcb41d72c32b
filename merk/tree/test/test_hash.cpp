// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <merk/core/byte_string.hpp>
#include <merk/tree/hash.hpp>

#include <ethash/keccak.hpp>

#include <gtest/gtest.h>

#include <cstring>

using namespace merk;

TEST(Hash, null_hash_is_zero)
{
    for (auto const b : NULL_HASH) {
        EXPECT_EQ(b, 0);
    }
}

TEST(Hash, kv_hash_deterministic)
{
    auto const key = to_byte_string_view("key");
    auto const value = to_byte_string_view("value");
    EXPECT_EQ(kv_hash(key, value), kv_hash(key, value));
    EXPECT_NE(kv_hash(key, value), NULL_HASH);
    EXPECT_NE(kv_hash(key, value), kv_hash(value, key));
}

TEST(Hash, kv_hash_length_prefixed)
{
    // the same concatenated bytes split differently
    EXPECT_NE(
        kv_hash(to_byte_string_view("ab"), to_byte_string_view("c")),
        kv_hash(to_byte_string_view("a"), to_byte_string_view("bc")));
    EXPECT_NE(
        kv_hash(to_byte_string_view("a"), byte_string_view{}),
        kv_hash(byte_string_view{}, to_byte_string_view("a")));
}

TEST(Hash, node_hash_commits_to_children_order)
{
    auto const kv = kv_hash(to_byte_string_view("k"), to_byte_string_view("v"));
    auto const a = kv_hash(to_byte_string_view("a"), to_byte_string_view("1"));
    auto const b = kv_hash(to_byte_string_view("b"), to_byte_string_view("2"));

    EXPECT_EQ(node_hash(kv, a, b), node_hash(kv, a, b));
    EXPECT_NE(node_hash(kv, a, b), node_hash(kv, b, a));
    EXPECT_NE(node_hash(kv, a, NULL_HASH), node_hash(kv, NULL_HASH, a));
    EXPECT_NE(node_hash(kv, NULL_HASH, NULL_HASH), kv);
}

TEST(Hash, kv_hash_big_endian_lengths)
{
    byte_string const value(300, 0x7b);
    byte_string expected{0x00, 0x00, 0x00, 0x03, 'k', 'e', 'y'};
    expected += byte_string{0x00, 0x00, 0x01, 0x2c};
    expected += value;

    auto const hashed = ethash::keccak256(expected.data(), expected.size());
    hash_t reference;
    std::memcpy(reference.data(), hashed.bytes, HASH_LENGTH);

    EXPECT_EQ(kv_hash(to_byte_string_view("key"), value), reference);
}

TEST(Hash, to_hex)
{
    EXPECT_EQ(to_hex(NULL_HASH), std::string(2 * HASH_LENGTH, '0'));
    hash_t h{};
    h[0] = 0xab;
    h[HASH_LENGTH - 1] = 0x01;
    auto const hex = to_hex(h);
    EXPECT_EQ(hex.substr(0, 2), "ab");
    EXPECT_EQ(hex.substr(hex.size() - 2), "01");
}
