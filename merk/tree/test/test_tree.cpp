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
#include <merk/tree/error.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/tree.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace merk;

namespace
{
    byte_string bytes(char const *const s)
    {
        return byte_string{to_byte_string_view(s)};
    }

    class RecordingCommitter final : public Committer
    {
    public:
        std::vector<byte_string> written;

        void write(Tree const &tree) override
        {
            written.emplace_back(tree.key());
        }
    };
}

TEST(Tree, leaf)
{
    Tree const tree{bytes("b"), bytes("2")};
    EXPECT_EQ(tree.height(), 1);
    EXPECT_EQ(tree.balance_factor(), 0);
    EXPECT_EQ(tree.kv_hash(), kv_hash(tree.key(), tree.value()));
    EXPECT_EQ(tree.hash(), node_hash(tree.kv_hash(), NULL_HASH, NULL_HASH));
    EXPECT_FALSE(tree.link(true).has_value());
    EXPECT_FALSE(tree.link(false).has_value());
}

TEST(Tree, attach_and_commit)
{
    auto root = std::make_unique<Tree>(bytes("b"), bytes("2"));
    root->attach(true, std::make_unique<Tree>(bytes("a"), bytes("1")));
    auto right = std::make_unique<Tree>(bytes("d"), bytes("4"));
    right->attach(true, std::make_unique<Tree>(bytes("c"), bytes("3")));
    root->attach(false, std::move(right));
    root->attach(true, nullptr);

    EXPECT_EQ(root->height(), 3);
    EXPECT_EQ(root->balance_factor(), 1);
    EXPECT_TRUE(root->link(true)->modified);

    auto const hash_before_commit = root->hash();

    RecordingCommitter committer;
    commit(*root, committer);
    std::vector<byte_string> const expected{
        bytes("a"), bytes("c"), bytes("d"), bytes("b")};
    EXPECT_EQ(committer.written, expected);

    auto const &right_link = root->link(false);
    ASSERT_TRUE(right_link.has_value());
    EXPECT_FALSE(right_link->modified);
    EXPECT_EQ(right_link->hash, right_link->tree->hash());
    EXPECT_EQ(right_link->child_heights[0], 1);
    EXPECT_EQ(right_link->child_heights[1], 0);
    EXPECT_EQ(root->hash(), hash_before_commit);

    root->prune();
    EXPECT_EQ(root->link(true)->tree, nullptr);
    EXPECT_EQ(root->link(false)->tree, nullptr);
    EXPECT_EQ(root->hash(), hash_before_commit);
    EXPECT_EQ(root->height(), 3);
}

TEST(Tree, set_value_updates_kv_hash)
{
    Tree tree{bytes("k"), bytes("old")};
    auto const old_hash = tree.hash();
    tree.set_value(bytes("new"));
    EXPECT_EQ(tree.value(), bytes("new"));
    EXPECT_EQ(tree.kv_hash(), kv_hash(tree.key(), tree.value()));
    EXPECT_NE(tree.hash(), old_hash);
}

TEST(Tree, encoding)
{
    auto root = std::make_unique<Tree>(bytes("m"), bytes("value"));
    root->attach(false, std::make_unique<Tree>(bytes("z"), bytes("zz")));
    RecordingCommitter committer;
    commit(*root, committer);

    auto const encoded = root->encode();
    // no left, right link, kv hash, value
    ASSERT_EQ(encoded.size(), 1 + (1 + 1 + 1 + HASH_LENGTH + 2) + HASH_LENGTH + 5);
    EXPECT_EQ(encoded[0], 0x00);
    EXPECT_EQ(encoded[1], 0x01);
    EXPECT_EQ(encoded[2], 1);
    EXPECT_EQ(encoded[3], 'z');

    auto const decoded = Tree::decode(root->key(), encoded);
    ASSERT_TRUE(decoded.has_value());
    auto const &tree = *decoded.value();
    EXPECT_EQ(tree.key(), root->key());
    EXPECT_EQ(tree.value(), root->value());
    EXPECT_EQ(tree.kv_hash(), root->kv_hash());
    EXPECT_EQ(tree.hash(), root->hash());
    EXPECT_EQ(tree.height(), 2);
    EXPECT_FALSE(tree.link(true).has_value());
    ASSERT_TRUE(tree.link(false).has_value());
    EXPECT_EQ(tree.link(false)->key, bytes("z"));
    EXPECT_EQ(tree.link(false)->tree, nullptr);
}

TEST(Tree, decode_empty_value)
{
    Tree const leaf{bytes("k"), byte_string{}};
    auto const decoded = Tree::decode(leaf.key(), leaf.encode());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded.value()->value().empty());
    EXPECT_EQ(decoded.value()->hash(), leaf.hash());
}

TEST(Tree, decode_truncated)
{
    auto root = std::make_unique<Tree>(bytes("m"), bytes("value"));
    root->attach(true, std::make_unique<Tree>(bytes("a"), bytes("aa")));
    RecordingCommitter committer;
    commit(*root, committer);
    auto const encoded = root->encode();

    // anything shorter than links + kv hash is invalid
    for (size_t const len : {size_t{0}, size_t{1}, size_t{3}, size_t{30}, encoded.size() - 6}) {
        auto const res =
            Tree::decode(root->key(), byte_string_view{encoded}.substr(0, len));
        ASSERT_TRUE(res.has_error()) << len;
        EXPECT_EQ(res.error(), TreeError::InvalidNodeEncoding);
    }
}

TEST(Tree, decode_bad_presence_byte)
{
    byte_string encoded(2 + HASH_LENGTH, 0);
    encoded[0] = 0x02;
    auto const res = Tree::decode(bytes("k"), encoded);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), TreeError::InvalidNodeEncoding);
}

TEST(TreeDeathTest, attach_occupied_slot)
{
    Tree tree{bytes("b"), bytes("2")};
    tree.attach(true, std::make_unique<Tree>(bytes("a"), bytes("1")));
    EXPECT_DEATH(
        tree.attach(true, std::make_unique<Tree>(bytes("0"), bytes("0"))),
        "Assertion");
}
