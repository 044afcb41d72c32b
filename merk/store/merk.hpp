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
#include <merk/store/merk_config.hpp>
#include <merk/store/snapshot.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/ops.hpp>
#include <merk/tree/tree.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>

MERK_NAMESPACE_BEGIN

namespace detail
{
    class Db;
}

class ChunkProducer;

// Merkle AVL tree persisted in RocksDB. Only the root node stays resident
// between batches, the rest is read on demand.
class Merk
{
    std::filesystem::path path_;
    std::shared_ptr<detail::Db> db_;
    std::unique_ptr<Tree> tree_;
    size_t max_batch_bytes_;

    Merk(
        std::filesystem::path, std::shared_ptr<detail::Db>,
        std::unique_ptr<Tree>, size_t max_batch_bytes);

    Result<void> write(
        Tree *, std::span<byte_string const> deleted_keys,
        std::span<BatchEntry const> aux);

public:
    Merk(Merk &&) noexcept;
    Merk &operator=(Merk &&) noexcept;
    ~Merk();

    static Result<Merk>
    open(std::filesystem::path const &, MerkConfig const & = {});

    std::filesystem::path const &path() const
    {
        return path_;
    }

    Tree const *root() const
    {
        return tree_.get();
    }

    // NULL_HASH when empty
    hash_t root_hash() const;

    Result<std::optional<byte_string>> get(byte_string_view key) const;
    Result<std::optional<byte_string>> get_aux(byte_string_view key) const;

    // Applies `batch` to the tree and writes the changed nodes, the aux
    // entries and the new root in one atomic write. `batch` must be sorted
    // with unique keys.
    Result<void> apply(
        std::span<BatchEntry const> batch,
        std::span<BatchEntry const> aux = {});

    Result<void> flush() const;

    // Copies the current state to `path` and opens the copy
    Result<Merk> checkpoint(std::filesystem::path const &path) const;

    // Closes the store and deletes its files
    Result<void> destroy() &&;

    Result<std::shared_ptr<Snapshot const>> snapshot() const;

    // Producer over a snapshot of the current state
    Result<ChunkProducer> chunks() const;
};

MERK_NAMESPACE_END
