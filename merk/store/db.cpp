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
#include <merk/core/result.hpp>
#include <merk/store/db.hpp>
#include <merk/store/error.hpp>
#include <merk/store/merk_config.hpp>
#include <merk/store/rocksdb_util.hpp>
#include <merk/tree/tree.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/status.h>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

MERK_NAMESPACE_BEGIN

namespace detail
{
    Db::Db(
        std::unique_ptr<rocksdb::DB> db,
        std::vector<rocksdb::ColumnFamilyHandle *> cfs)
        : db_{std::move(db)}
        , cfs_{std::move(cfs)}
    {
        MERK_ASSERT(db_ != nullptr);
        MERK_ASSERT(cfs_.size() == 3);
    }

    Db::~Db()
    {
        for (auto *const cf : cfs_) {
            auto const s = db_->DestroyColumnFamilyHandle(cf);
            if (!s.ok()) {
                LOG_WARNING("rocksdb: {}", s.ToString());
            }
        }
        cfs_.clear();
    }

    Result<std::shared_ptr<Db>>
    Db::open(std::filesystem::path const &path, MerkConfig const &config)
    {
        rocksdb::Options options;
        options.create_if_missing = config.create_if_missing;
        options.create_missing_column_families = true;
        options.max_open_files = config.max_open_files;
        options.IncreaseParallelism(config.parallelism);
        if (config.optimize_level_style_compaction) {
            options.OptimizeLevelStyleCompaction();
        }

        std::vector<rocksdb::ColumnFamilyDescriptor> cfds;
        cfds.emplace_back(
            rocksdb::kDefaultColumnFamilyName, rocksdb::ColumnFamilyOptions{});
        cfds.emplace_back(
            std::string{AUX_CF_NAME}, rocksdb::ColumnFamilyOptions{});
        cfds.emplace_back(
            std::string{INTERNAL_CF_NAME}, rocksdb::ColumnFamilyOptions{});

        rocksdb::DB *db = nullptr;
        std::vector<rocksdb::ColumnFamilyHandle *> cfs;
        BOOST_OUTCOME_TRY(check_status(
            rocksdb::DB::Open(options, path.string(), cfds, &cfs, &db)));
        MERK_ASSERT(db != nullptr);

        return std::make_shared<Db>(
            std::unique_ptr<rocksdb::DB>{db}, std::move(cfs));
    }

    Result<std::unique_ptr<Tree>> read_node(
        Db const &db, rocksdb::Snapshot const *const snapshot,
        byte_string_view const key)
    {
        rocksdb::ReadOptions options;
        options.snapshot = snapshot;
        rocksdb::PinnableSlice value;
        auto const s =
            db.db().Get(options, db.tree_cf(), to_slice(key), &value);
        if (s.IsNotFound()) {
            LOG_ERROR("missing tree node {}", to_hex(key));
            return StoreError::Corruption;
        }
        BOOST_OUTCOME_TRY(check_status(s));
        return Tree::decode(key, to_view(value));
    }

    Result<std::unique_ptr<Tree>>
    read_root(Db const &db, rocksdb::Snapshot const *const snapshot)
    {
        rocksdb::ReadOptions options;
        options.snapshot = snapshot;
        rocksdb::PinnableSlice root_key;
        auto const s = db.db().Get(
            options,
            db.internal_cf(),
            rocksdb::Slice{ROOT_KEY.data(), ROOT_KEY.size()},
            &root_key);
        if (s.IsNotFound()) {
            return std::unique_ptr<Tree>{};
        }
        BOOST_OUTCOME_TRY(check_status(s));
        return read_node(db, snapshot, to_view(root_key));
    }
}

MERK_NAMESPACE_END
