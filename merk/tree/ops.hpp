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
#include <merk/tree/fetch.hpp>
#include <merk/tree/tree.hpp>

#include <memory>
#include <span>
#include <utility>
#include <variant>
#include <vector>

MERK_NAMESPACE_BEGIN

struct Put
{
    byte_string value;
};

struct Delete
{
};

using BatchOp = std::variant<Put, Delete>;
using BatchEntry = std::pair<byte_string, BatchOp>;
using Batch = std::vector<BatchEntry>;

// Keys strictly ascending, within the key and value length limits
Result<void> validate_batch(std::span<BatchEntry const>);

// Applies a validated batch to a possibly empty tree and returns the new
// root. Deleting an absent key is a no-op. Keys of removed nodes are
// appended to `deleted_keys`.
Result<std::unique_ptr<Tree>> apply_to(
    std::unique_ptr<Tree>, std::span<BatchEntry const>, Fetch const &,
    std::vector<byte_string> &deleted_keys);

MERK_NAMESPACE_END
