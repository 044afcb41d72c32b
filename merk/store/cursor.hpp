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

MERK_NAMESPACE_BEGIN

// Bidirectional, seekable iteration over the stored nodes of one snapshot in
// key order. Values are encoded `Tree` nodes.
class Cursor
{
public:
    virtual ~Cursor() = default;

    virtual void seek_to_first() = 0;
    // Positions at the first key not less than `key`
    virtual void seek(byte_string_view key) = 0;
    virtual void next() = 0;
    virtual void prev() = 0;

    virtual bool valid() const = 0;
    virtual byte_string_view key() const = 0;
    virtual byte_string_view value() const = 0;

    // Error encountered by the last positioning call, if any
    virtual Result<void> status() const = 0;
};

MERK_NAMESPACE_END
