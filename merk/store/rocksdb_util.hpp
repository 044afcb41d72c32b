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
#include <merk/core/likely.h>
#include <merk/core/result.hpp>
#include <merk/store/error.hpp>

#include <quill/Quill.h>

#include <rocksdb/slice.h>
#include <rocksdb/status.h>

MERK_NAMESPACE_BEGIN

inline rocksdb::Slice to_slice(byte_string_view const s)
{
    return rocksdb::Slice{reinterpret_cast<char const *>(s.data()), s.size()};
}

inline byte_string_view to_view(rocksdb::Slice const &s)
{
    return byte_string_view{
        reinterpret_cast<unsigned char const *>(s.data()), s.size()};
}

inline StoreError to_store_error(rocksdb::Status const &s)
{
    if (s.IsNotFound()) {
        return StoreError::NotFound;
    }
    if (s.IsCorruption()) {
        return StoreError::Corruption;
    }
    if (s.IsIOError()) {
        return StoreError::IoError;
    }
    if (s.IsInvalidArgument()) {
        return StoreError::InvalidArgument;
    }
    return StoreError::Other;
}

inline Result<void> check_status(rocksdb::Status const &s)
{
    if (MERK_LIKELY(s.ok())) {
        return success();
    }
    LOG_ERROR("rocksdb: {}", s.ToString());
    return to_store_error(s);
}

MERK_NAMESPACE_END
