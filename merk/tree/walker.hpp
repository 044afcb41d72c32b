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
#include <optional>

MERK_NAMESPACE_BEGIN

// Read-only traversal. Resident children are borrowed, pruned ones are
// fetched and owned by the returned walker, never cached in the tree.
class Walker
{
    std::unique_ptr<Tree> owned_;
    Tree const *tree_;
    Fetch const *source_;

public:
    Walker(Tree const &, Fetch const &);
    Walker(std::unique_ptr<Tree>, Fetch const &);

    Tree const &tree() const
    {
        return *tree_;
    }

    Result<std::optional<Walker>> walk(bool left) const;
};

Result<std::optional<byte_string>> get(Walker const &root, byte_string_view key);

MERK_NAMESPACE_END
