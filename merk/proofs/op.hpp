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
#include <merk/proofs/config.hpp>
#include <merk/tree/hash.hpp>

#include <variant>

MERK_PROOFS_NAMESPACE_BEGIN

// Subtree known only by its hash
struct Hash
{
    hash_t hash;

    bool operator==(Hash const &) const = default;
};

// Node known by its kv hash, children follow in the proof
struct KVHash
{
    hash_t hash;

    bool operator==(KVHash const &) const = default;
};

struct KV
{
    byte_string key;
    byte_string value;

    bool operator==(KV const &) const = default;
};

using Node = std::variant<Hash, KVHash, KV>;

struct Push
{
    Node node;

    bool operator==(Push const &) const = default;
};

// Pops a parent then a child, attaches the child on the left
struct Parent
{
    bool operator==(Parent const &) const = default;
};

// Pops a child then a parent, attaches the child on the right
struct Child
{
    bool operator==(Child const &) const = default;
};

using Op = std::variant<Push, Parent, Child>;

MERK_PROOFS_NAMESPACE_END
