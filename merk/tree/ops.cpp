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
#include <merk/core/likely.h>
#include <merk/core/result.hpp>
#include <merk/tree/error.hpp>
#include <merk/tree/fetch.hpp>
#include <merk/tree/ops.hpp>
#include <merk/tree/tree.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <span>
#include <utility>
#include <variant>
#include <vector>

MERK_NAMESPACE_BEGIN

namespace
{
    using batch_span = std::span<BatchEntry const>;

    Result<std::unique_ptr<Tree>>
    detach(Tree &tree, bool const left, Fetch const &source)
    {
        auto &link = tree.link(left);
        if (!link.has_value()) {
            return std::unique_ptr<Tree>{};
        }
        std::unique_ptr<Tree> child = std::move(link->tree);
        if (child == nullptr) {
            BOOST_OUTCOME_TRY(auto fetched, source.fetch(*link));
            child = std::move(fetched);
        }
        link.reset();
        return child;
    }

    Result<std::unique_ptr<Tree>>
    maybe_balance(std::unique_ptr<Tree>, Fetch const &);

    // Rotates the child on the `left` side up into the position of `tree`
    Result<std::unique_ptr<Tree>>
    rotate(std::unique_ptr<Tree> tree, bool const left, Fetch const &source)
    {
        BOOST_OUTCOME_TRY(auto child, detach(*tree, left, source));
        MERK_ASSERT(child != nullptr);
        BOOST_OUTCOME_TRY(auto grandchild, detach(*child, !left, source));
        tree->attach(left, std::move(grandchild));
        BOOST_OUTCOME_TRY(auto balanced, maybe_balance(std::move(tree), source));
        child->attach(!left, std::move(balanced));
        return maybe_balance(std::move(child), source);
    }

    Result<std::unique_ptr<Tree>>
    maybe_balance(std::unique_ptr<Tree> tree, Fetch const &source)
    {
        int const balance_factor = tree->balance_factor();
        if (std::abs(balance_factor) <= 1) {
            return tree;
        }
        bool const left = balance_factor < 0;
        // double rotation when the taller child leans the other way
        if (left == (tree->link(left)->balance_factor() > 0)) {
            BOOST_OUTCOME_TRY(auto child, detach(*tree, left, source));
            BOOST_OUTCOME_TRY(
                auto rotated, rotate(std::move(child), !left, source));
            tree->attach(left, std::move(rotated));
        }
        return rotate(std::move(tree), left, source);
    }

    // Removes the outermost node on the `left` side. Returns it detached
    // together with what remains of the subtree.
    Result<std::pair<std::unique_ptr<Tree>, std::unique_ptr<Tree>>>
    remove_edge(std::unique_ptr<Tree> tree, bool const left, Fetch const &source)
    {
        if (tree->link(left).has_value()) {
            BOOST_OUTCOME_TRY(auto child, detach(*tree, left, source));
            BOOST_OUTCOME_TRY(
                auto removed, remove_edge(std::move(child), left, source));
            tree->attach(left, std::move(removed.second));
            BOOST_OUTCOME_TRY(
                auto balanced, maybe_balance(std::move(tree), source));
            return std::make_pair(std::move(removed.first), std::move(balanced));
        }
        BOOST_OUTCOME_TRY(auto child, detach(*tree, !left, source));
        return std::make_pair(std::move(tree), std::move(child));
    }

    Result<std::unique_ptr<Tree>> promote_edge(
        std::unique_ptr<Tree> tree, bool const left,
        std::unique_ptr<Tree> attach, Fetch const &source)
    {
        BOOST_OUTCOME_TRY(auto removed, remove_edge(std::move(tree), left, source));
        auto edge = std::move(removed.first);
        edge->attach(!left, std::move(removed.second));
        edge->attach(left, std::move(attach));
        return maybe_balance(std::move(edge), source);
    }

    // Removes the root of `tree`, replacing it with the nearest key from
    // its taller side
    Result<std::unique_ptr<Tree>>
    remove(std::unique_ptr<Tree> tree, Fetch const &source)
    {
        bool const has_left = tree->link(true).has_value();
        bool const has_right = tree->link(false).has_value();
        bool const left = tree->child_height(true) > tree->child_height(false);

        if (has_left && has_right) {
            BOOST_OUTCOME_TRY(auto tall_child, detach(*tree, left, source));
            BOOST_OUTCOME_TRY(auto short_child, detach(*tree, !left, source));
            return promote_edge(
                std::move(tall_child), !left, std::move(short_child), source);
        }
        if (has_left || has_right) {
            return detach(*tree, left, source);
        }
        return std::unique_ptr<Tree>{};
    }

    Result<std::unique_ptr<Tree>> apply(
        std::unique_ptr<Tree>, batch_span, Fetch const &,
        std::vector<byte_string> &);

    Result<std::unique_ptr<Tree>> recurse(
        std::unique_ptr<Tree> tree, batch_span const batch, size_t const mid,
        bool const exclusive, Fetch const &source,
        std::vector<byte_string> &deleted_keys)
    {
        auto const left_batch = batch.first(mid);
        auto const right_batch =
            exclusive ? batch.subspan(mid + 1) : batch.subspan(mid);

        if (!left_batch.empty()) {
            BOOST_OUTCOME_TRY(auto child, detach(*tree, true, source));
            BOOST_OUTCOME_TRY(
                auto applied,
                apply_to(std::move(child), left_batch, source, deleted_keys));
            tree->attach(true, std::move(applied));
        }
        if (!right_batch.empty()) {
            BOOST_OUTCOME_TRY(auto child, detach(*tree, false, source));
            BOOST_OUTCOME_TRY(
                auto applied,
                apply_to(std::move(child), right_batch, source, deleted_keys));
            tree->attach(false, std::move(applied));
        }
        return maybe_balance(std::move(tree), source);
    }

    // Builds a balanced subtree by rooting it at the middle of the batch
    Result<std::unique_ptr<Tree>> build(
        batch_span const batch, Fetch const &source,
        std::vector<byte_string> &deleted_keys)
    {
        if (batch.empty()) {
            return std::unique_ptr<Tree>{};
        }
        size_t const mid = batch.size() / 2;
        auto const &[key, op] = batch[mid];
        if (std::holds_alternative<Delete>(op)) {
            BOOST_OUTCOME_TRY(
                auto tree, build(batch.first(mid), source, deleted_keys));
            return apply_to(
                std::move(tree), batch.subspan(mid + 1), source, deleted_keys);
        }
        auto tree = std::make_unique<Tree>(key, std::get<Put>(op).value);
        return recurse(std::move(tree), batch, mid, true, source, deleted_keys);
    }

    Result<std::unique_ptr<Tree>> apply(
        std::unique_ptr<Tree> tree, batch_span const batch,
        Fetch const &source, std::vector<byte_string> &deleted_keys)
    {
        auto const it = std::lower_bound(
            batch.begin(),
            batch.end(),
            tree->key(),
            [](BatchEntry const &entry, byte_string_view const key) {
                return byte_string_view{entry.first} < key;
            });
        size_t const index = static_cast<size_t>(it - batch.begin());
        bool const found = it != batch.end() && it->first == tree->key();

        if (found) {
            if (auto const *const put = std::get_if<Put>(&it->second)) {
                tree->set_value(put->value);
            }
            else {
                deleted_keys.emplace_back(tree->key());
                BOOST_OUTCOME_TRY(
                    auto replacement, remove(std::move(tree), source));
                BOOST_OUTCOME_TRY(
                    auto left_applied,
                    apply_to(
                        std::move(replacement),
                        batch.first(index),
                        source,
                        deleted_keys));
                return apply_to(
                    std::move(left_applied),
                    batch.subspan(index + 1),
                    source,
                    deleted_keys);
            }
        }
        return recurse(
            std::move(tree), batch, index, found, source, deleted_keys);
    }
}

Result<void> validate_batch(std::span<BatchEntry const> const batch)
{
    for (size_t i = 0; i < batch.size(); ++i) {
        auto const &[key, op] = batch[i];
        if (MERK_UNLIKELY(key.empty())) {
            return TreeError::EmptyKey;
        }
        if (MERK_UNLIKELY(key.size() > MAX_KEY_LENGTH)) {
            return TreeError::KeyTooLong;
        }
        if (auto const *const put = std::get_if<Put>(&op);
            put != nullptr && put->value.size() > MAX_VALUE_LENGTH) {
            return TreeError::ValueTooLong;
        }
        if (i > 0) {
            auto const &prev = batch[i - 1].first;
            if (MERK_UNLIKELY(key == prev)) {
                return TreeError::DuplicateKey;
            }
            if (MERK_UNLIKELY(key < prev)) {
                return TreeError::UnsortedBatch;
            }
        }
    }
    return success();
}

Result<std::unique_ptr<Tree>> apply_to(
    std::unique_ptr<Tree> tree, std::span<BatchEntry const> const batch,
    Fetch const &source, std::vector<byte_string> &deleted_keys)
{
    if (batch.empty()) {
        return tree;
    }
    if (tree == nullptr) {
        return build(batch, source, deleted_keys);
    }
    return apply(std::move(tree), batch, source, deleted_keys);
}

MERK_NAMESPACE_END
