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

#include <merk/core/assert.h>
#include <merk/core/byte_string.hpp>
#include <merk/core/config.hpp>
#include <merk/core/likely.h>
#include <merk/core/result.hpp>
#include <merk/tree/error.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/tree.hpp>

#include <algorithm>
#include <cstring>
#include <memory>
#include <optional>
#include <utility>

MERK_NAMESPACE_BEGIN

Link::Link(
    byte_string key, hash_t const &hash,
    std::array<uint8_t, 2> const child_heights)
    : key{std::move(key)}
    , hash{hash}
    , child_heights{child_heights}
    , tree{}
    , modified{false}
{
}

Link::Link(std::unique_ptr<Tree> modified_tree)
    : key{modified_tree->key()}
    , hash{NULL_HASH}
    , child_heights{modified_tree->child_heights()}
    , tree{std::move(modified_tree)}
    , modified{true}
{
}

Link::Link(Link &&) noexcept = default;
Link &Link::operator=(Link &&) noexcept = default;
Link::~Link() = default;

Tree::Tree(byte_string key, byte_string value)
    : key_{std::move(key)}
    , value_{std::move(value)}
    , kv_hash_{MERK_NAMESPACE::kv_hash(key_, value_)}
{
}

Tree::Tree(
    byte_string key, byte_string value, hash_t const &kv_hash,
    std::optional<Link> left, std::optional<Link> right)
    : key_{std::move(key)}
    , value_{std::move(value)}
    , kv_hash_{kv_hash}
    , left_{std::move(left)}
    , right_{std::move(right)}
{
}

hash_t Tree::child_hash(bool const left) const
{
    auto const &l = link(left);
    if (!l.has_value()) {
        return NULL_HASH;
    }
    if (l->modified) {
        MERK_ASSERT(l->tree != nullptr);
        return l->tree->hash();
    }
    return l->hash;
}

uint8_t Tree::child_height(bool const left) const
{
    auto const &l = link(left);
    return l.has_value() ? l->height() : 0;
}

std::array<uint8_t, 2> Tree::child_heights() const
{
    return {child_height(true), child_height(false)};
}

uint8_t Tree::height() const
{
    return static_cast<uint8_t>(
        1 + std::max(child_height(true), child_height(false)));
}

int Tree::balance_factor() const
{
    return static_cast<int>(child_height(false)) -
           static_cast<int>(child_height(true));
}

hash_t Tree::hash() const
{
    return node_hash(kv_hash_, child_hash(true), child_hash(false));
}

void Tree::set_value(byte_string value)
{
    value_ = std::move(value);
    kv_hash_ = MERK_NAMESPACE::kv_hash(key_, value_);
}

void Tree::attach(bool const left, std::unique_ptr<Tree> child)
{
    if (child == nullptr) {
        return;
    }
    auto &slot = link(left);
    MERK_ASSERT(!slot.has_value());
    MERK_DEBUG_ASSERT(left ? child->key() < key_ : child->key() > key_);
    slot.emplace(std::move(child));
}

void Tree::prune()
{
    for (bool const left : {true, false}) {
        auto &l = link(left);
        if (l.has_value() && l->tree != nullptr) {
            MERK_ASSERT(!l->modified);
            l->tree.reset();
        }
    }
}

// Node layout, the key itself is the store key:
//
//   for left then right:
//     0x00                                      no child
//     0x01 u8 |key| key hash[32] u8 lh u8 rh    child link
//   kv_hash[32]
//   value                                       rest of the buffer
byte_string Tree::encode() const
{
    byte_string out;
    out.reserve(2 + HASH_LENGTH + value_.size());
    for (bool const left : {true, false}) {
        auto const &l = link(left);
        if (!l.has_value()) {
            out.push_back(0x00);
            continue;
        }
        MERK_ASSERT(!l->modified);
        MERK_ASSERT(l->key.size() <= MAX_KEY_LENGTH);
        out.push_back(0x01);
        out.push_back(static_cast<unsigned char>(l->key.size()));
        out += l->key;
        out.append(l->hash.data(), l->hash.size());
        out.push_back(l->child_heights[0]);
        out.push_back(l->child_heights[1]);
    }
    out.append(kv_hash_.data(), kv_hash_.size());
    out += value_;
    return out;
}

Result<std::unique_ptr<Tree>>
Tree::decode(byte_string_view const key, byte_string_view encoded)
{
    std::optional<Link> links[2];
    for (auto &l : links) {
        if (MERK_UNLIKELY(encoded.empty())) {
            return TreeError::InvalidNodeEncoding;
        }
        unsigned char const present = encoded[0];
        encoded.remove_prefix(1);
        if (present == 0x00) {
            continue;
        }
        if (MERK_UNLIKELY(present != 0x01 || encoded.empty())) {
            return TreeError::InvalidNodeEncoding;
        }
        size_t const key_len = encoded[0];
        encoded.remove_prefix(1);
        if (MERK_UNLIKELY(encoded.size() < key_len + HASH_LENGTH + 2)) {
            return TreeError::InvalidNodeEncoding;
        }
        byte_string child_key{encoded.substr(0, key_len)};
        encoded.remove_prefix(key_len);
        hash_t hash;
        std::memcpy(hash.data(), encoded.data(), HASH_LENGTH);
        encoded.remove_prefix(HASH_LENGTH);
        std::array<uint8_t, 2> const heights{encoded[0], encoded[1]};
        encoded.remove_prefix(2);
        l.emplace(std::move(child_key), hash, heights);
    }
    if (MERK_UNLIKELY(encoded.size() < HASH_LENGTH)) {
        return TreeError::InvalidNodeEncoding;
    }
    hash_t kv;
    std::memcpy(kv.data(), encoded.data(), HASH_LENGTH);
    encoded.remove_prefix(HASH_LENGTH);
    return std::make_unique<Tree>(
        byte_string{key},
        byte_string{encoded},
        kv,
        std::move(links[0]),
        std::move(links[1]));
}

void commit(Tree &tree, Committer &committer)
{
    for (bool const left : {true, false}) {
        auto &l = tree.link(left);
        if (!l.has_value() || !l->modified) {
            continue;
        }
        MERK_ASSERT(l->tree != nullptr);
        commit(*l->tree, committer);
        l->hash = l->tree->hash();
        l->child_heights = l->tree->child_heights();
        l->modified = false;
    }
    committer.write(tree);
}

MERK_NAMESPACE_END
