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
#include <merk/store/db_cursor.hpp>
#include <merk/store/rocksdb_util.hpp>

#include <rocksdb/iterator.h>

#include <memory>
#include <utility>

MERK_NAMESPACE_BEGIN

DbCursor::DbCursor(std::unique_ptr<rocksdb::Iterator> it)
    : it_{std::move(it)}
{
    MERK_ASSERT(it_ != nullptr);
}

void DbCursor::seek_to_first()
{
    it_->SeekToFirst();
}

void DbCursor::seek(byte_string_view const key)
{
    it_->Seek(to_slice(key));
}

void DbCursor::next()
{
    MERK_ASSERT(it_->Valid());
    it_->Next();
}

void DbCursor::prev()
{
    MERK_ASSERT(it_->Valid());
    it_->Prev();
}

bool DbCursor::valid() const
{
    return it_->Valid();
}

byte_string_view DbCursor::key() const
{
    return to_view(it_->key());
}

byte_string_view DbCursor::value() const
{
    return to_view(it_->value());
}

Result<void> DbCursor::status() const
{
    return check_status(it_->status());
}

MERK_NAMESPACE_END
