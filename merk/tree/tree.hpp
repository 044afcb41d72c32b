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

#pragma once

#include <merk/core/byte_string.hpp>
#include <merk/core/config.hpp>
#include <merk/core/result.hpp>
#include <merk/tree/hash.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

MERK_NAMESPACE_BEGIN

// Limits imposed by the proof encoding
inline constexpr size_t MAX_KEY_LENGTH = 255;
inline constexpr size_t MAX_VALUE_LENGTH = 65535;

class Tree;

// Reference from a node to one of its children. The child is resident only
// while `tree` is set, otherwise it is fetched by key.
struct Link
{
    byte_string key;
    hash_t hash;
    // (left, right) heights of the child's own subtrees
    std::array<uint8_t, 2> child_heights;
    std::unique_ptr<Tree> tree;
    // child changed since the last commit, `hash` is stale
    bool modified;

    Link(
        byte_string key, hash_t const &hash,
        std::array<uint8_t, 2> child_heights);
    explicit Link(std::unique_ptr<Tree> modified_tree);
    Link(Link &&) noexcept;
    Link &operator=(Link &&) noexcept;
    ~Link();

    uint8_t height() const
    {
        return static_cast<uint8_t>(
            1 + std::max(child_heights[0], child_heights[1]));
    }

    int balance_factor() const
    {
        return static_cast<int>(child_heights[1]) -
               static_cast<int>(child_heights[0]);
    }
};

// A node of the Merkle AVL tree. Nodes are stored one per key; children are
// referenced through links carrying their hash and heights.
class Tree
{
    byte_string key_;
    byte_string value_;
    hash_t kv_hash_;
    std::optional<Link> left_;
    std::optional<Link> right_;

public:
    Tree(byte_string key, byte_string value);
    Tree(
        byte_string key, byte_string value, hash_t const &kv_hash,
        std::optional<Link> left, std::optional<Link> right);

    byte_string_view key() const
    {
        return key_;
    }

    byte_string_view value() const
    {
        return value_;
    }

    hash_t const &kv_hash() const
    {
        return kv_hash_;
    }

    std::optional<Link> const &link(bool const left) const
    {
        return left ? left_ : right_;
    }

    std::optional<Link> &link(bool const left)
    {
        return left ? left_ : right_;
    }

    hash_t child_hash(bool left) const;
    uint8_t child_height(bool left) const;
    std::array<uint8_t, 2> child_heights() const;
    uint8_t height() const;
    int balance_factor() const;

    // Recomputes through modified children, so it is valid before commit
    hash_t hash() const;

    void set_value(byte_string value);

    // Attaching into an occupied slot is a bug. A null child is a no-op.
    void attach(bool left, std::unique_ptr<Tree> child);

    // Drops resident children, keeping only their links
    void prune();

    byte_string encode() const;

    static Result<std::unique_ptr<Tree>>
    decode(byte_string_view key, byte_string_view encoded);
};

class Committer
{
public:
    virtual ~Committer() = default;
    virtual void write(Tree const &) = 0;
};

// Refreshes the hashes and heights of modified links bottom-up and writes
// the root and every modified descendant
void commit(Tree &, Committer &);

MERK_NAMESPACE_END
