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
#include <merk/tree/fetch.hpp>
#include <merk/tree/tree.hpp>
#include <merk/tree/walker.hpp>

#include <boost/outcome/try.hpp>

#include <memory>
#include <optional>
#include <utility>

MERK_NAMESPACE_BEGIN

Walker::Walker(Tree const &tree, Fetch const &source)
    : owned_{}
    , tree_{&tree}
    , source_{&source}
{
}

Walker::Walker(std::unique_ptr<Tree> tree, Fetch const &source)
    : owned_{std::move(tree)}
    , tree_{owned_.get()}
    , source_{&source}
{
    MERK_ASSERT(tree_ != nullptr);
}

Result<std::optional<Walker>> Walker::walk(bool const left) const
{
    auto const &link = tree_->link(left);
    if (!link.has_value()) {
        return std::optional<Walker>{};
    }
    if (link->tree != nullptr) {
        return std::optional<Walker>{std::in_place, *link->tree, *source_};
    }
    BOOST_OUTCOME_TRY(auto child, source_->fetch(*link));
    return std::optional<Walker>{std::in_place, std::move(child), *source_};
}

Result<std::optional<byte_string>>
get(Walker const &root, byte_string_view const key)
{
    std::optional<Walker> cursor;
    Walker const *walker = &root;
    while (true) {
        auto const node_key = walker->tree().key();
        if (key == node_key) {
            return std::optional<byte_string>{walker->tree().value()};
        }
        BOOST_OUTCOME_TRY(auto child, walker->walk(key < node_key));
        if (!child.has_value()) {
            return std::optional<byte_string>{};
        }
        cursor = std::move(child);
        walker = &*cursor;
    }
}

MERK_NAMESPACE_END
