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

#include <merk/core/config.hpp>
#include <merk/core/result.hpp>
#include <merk/store/cursor.hpp>
#include <merk/tree/fetch.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/tree.hpp>
#include <merk/tree/walker.hpp>

#include <memory>
#include <optional>

namespace rocksdb
{
    class Snapshot;
}

MERK_NAMESPACE_BEGIN

namespace detail
{
    class Db;
}

// Immutable point-in-time view of a store. Later writes to the store are
// not visible through it, and it stays usable after the store is dropped.
class Snapshot final : public Fetch
{
    std::shared_ptr<detail::Db> db_;
    rocksdb::Snapshot const *snapshot_;
    std::unique_ptr<Tree> root_;

    Snapshot(std::shared_ptr<detail::Db>, rocksdb::Snapshot const *);

public:
    Snapshot(Snapshot const &) = delete;
    Snapshot &operator=(Snapshot const &) = delete;
    ~Snapshot() override;

    static Result<std::shared_ptr<Snapshot const>>
        create(std::shared_ptr<detail::Db>);

    Tree const *root() const
    {
        return root_.get();
    }

    hash_t root_hash() const;

    // Empty when the tree is empty
    std::optional<Walker> walker() const;

    Result<std::unique_ptr<Tree>> fetch(Link const &) const override;

    // Unpositioned cursor over the stored nodes. Must not outlive the
    // snapshot.
    std::unique_ptr<Cursor> cursor() const;
};

MERK_NAMESPACE_END
