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
#include <merk/core/config.hpp>
#include <merk/core/result.hpp>
#include <merk/store/cursor.hpp>
#include <merk/store/db.hpp>
#include <merk/store/db_cursor.hpp>
#include <merk/store/snapshot.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/tree.hpp>
#include <merk/tree/walker.hpp>

#include <boost/outcome/try.hpp>

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/snapshot.h>

#include <memory>
#include <optional>
#include <utility>

MERK_NAMESPACE_BEGIN

Snapshot::Snapshot(
    std::shared_ptr<detail::Db> db, rocksdb::Snapshot const *const snapshot)
    : db_{std::move(db)}
    , snapshot_{snapshot}
    , root_{}
{
    MERK_ASSERT(snapshot_ != nullptr);
}

Snapshot::~Snapshot()
{
    db_->db().ReleaseSnapshot(snapshot_);
}

Result<std::shared_ptr<Snapshot const>>
Snapshot::create(std::shared_ptr<detail::Db> db)
{
    MERK_ASSERT(db != nullptr);
    auto const *const snapshot = db->db().GetSnapshot();
    // constructor is private
    std::shared_ptr<Snapshot> result{new Snapshot{std::move(db), snapshot}};
    BOOST_OUTCOME_TRY(
        auto root, detail::read_root(*result->db_, result->snapshot_));
    result->root_ = std::move(root);
    return std::shared_ptr<Snapshot const>{std::move(result)};
}

hash_t Snapshot::root_hash() const
{
    return root_ == nullptr ? NULL_HASH : root_->hash();
}

std::optional<Walker> Snapshot::walker() const
{
    if (root_ == nullptr) {
        return std::nullopt;
    }
    return std::optional<Walker>{std::in_place, *root_, *this};
}

Result<std::unique_ptr<Tree>> Snapshot::fetch(Link const &link) const
{
    return detail::read_node(*db_, snapshot_, link.key);
}

std::unique_ptr<Cursor> Snapshot::cursor() const
{
    rocksdb::ReadOptions options;
    options.snapshot = snapshot_;
    return std::make_unique<DbCursor>(std::unique_ptr<rocksdb::Iterator>{
        db_->db().NewIterator(options, db_->tree_cf())});
}

MERK_NAMESPACE_END
