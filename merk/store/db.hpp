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
#include <merk/tree/tree.hpp>

#include <rocksdb/db.h>
#include <rocksdb/snapshot.h>

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

MERK_NAMESPACE_BEGIN

namespace detail
{
    inline constexpr std::string_view AUX_CF_NAME = "aux";
    inline constexpr std::string_view INTERNAL_CF_NAME = "internal";
    // key of the root node, in the internal column family
    inline constexpr std::string_view ROOT_KEY = "root";

    // Open RocksDB instance with the tree (default), aux and internal
    // column families. Shared by a store and its snapshots.
    class Db
    {
        std::unique_ptr<rocksdb::DB> db_;
        std::vector<rocksdb::ColumnFamilyHandle *> cfs_;

    public:
        Db(std::unique_ptr<rocksdb::DB>,
           std::vector<rocksdb::ColumnFamilyHandle *>);
        Db(Db const &) = delete;
        Db &operator=(Db const &) = delete;
        ~Db();

        static Result<std::shared_ptr<Db>>
        open(std::filesystem::path const &, MerkConfig const &);

        rocksdb::DB &db() const
        {
            return *db_;
        }

        rocksdb::ColumnFamilyHandle *tree_cf() const
        {
            return cfs_[0];
        }

        rocksdb::ColumnFamilyHandle *aux_cf() const
        {
            return cfs_[1];
        }

        rocksdb::ColumnFamilyHandle *internal_cf() const
        {
            return cfs_[2];
        }

        std::vector<rocksdb::ColumnFamilyHandle *> const &cfs() const
        {
            return cfs_;
        }
    };

    // Loads a stored node, a dangling key is corruption. A null snapshot
    // reads the latest state.
    Result<std::unique_ptr<Tree>> read_node(
        Db const &, rocksdb::Snapshot const *, byte_string_view key);

    // Null when the tree is empty
    Result<std::unique_ptr<Tree>>
    read_root(Db const &, rocksdb::Snapshot const *);
}

MERK_NAMESPACE_END
