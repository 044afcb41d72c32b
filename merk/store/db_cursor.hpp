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
#include <merk/store/cursor.hpp>

#include <rocksdb/iterator.h>

#include <memory>

MERK_NAMESPACE_BEGIN

// Cursor over a RocksDB iterator. The iterator must not outlive the
// snapshot it reads.
class DbCursor final : public Cursor
{
    std::unique_ptr<rocksdb::Iterator> it_;

public:
    explicit DbCursor(std::unique_ptr<rocksdb::Iterator>);

    void seek_to_first() override;
    void seek(byte_string_view key) override;
    void next() override;
    void prev() override;

    bool valid() const override;
    byte_string_view key() const override;
    byte_string_view value() const override;

    Result<void> status() const override;
};

MERK_NAMESPACE_END
