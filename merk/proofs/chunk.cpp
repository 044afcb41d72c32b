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
#include <merk/core/likely.h>
#include <merk/core/result.hpp>
#include <merk/proofs/chunk.hpp>
#include <merk/proofs/config.hpp>
#include <merk/proofs/encoding.hpp>
#include <merk/proofs/error.hpp>
#include <merk/proofs/op.hpp>
#include <merk/proofs/proof_tree.hpp>
#include <merk/store/cursor.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/tree.hpp>
#include <merk/tree/walker.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

MERK_PROOFS_NAMESPACE_BEGIN

namespace
{
    // Returns the trunk height, half the depth of the leftmost leaf
    Result<size_t> traverse_for_height_proof(
        Walker const &walker, std::vector<Op> &proof, size_t const depth)
    {
        BOOST_OUTCOME_TRY(auto const maybe_left, walker.walk(true));
        bool const has_left = maybe_left.has_value();

        size_t trunk_height = depth / 2;
        if (has_left) {
            BOOST_OUTCOME_TRY(
                auto const height,
                traverse_for_height_proof(*maybe_left, proof, depth + 1));
            trunk_height = height;
        }

        if (depth > trunk_height) {
            auto const &tree = walker.tree();
            proof.emplace_back(Push{KVHash{tree.kv_hash()}});
            if (has_left) {
                proof.emplace_back(Parent{});
            }
            if (auto const &right = tree.link(false); right.has_value()) {
                MERK_ASSERT(!right->modified);
                proof.emplace_back(Push{Hash{right->hash}});
                proof.emplace_back(Child{});
            }
        }

        return trunk_height;
    }

    Result<void> traverse_for_trunk(
        Walker const &walker, std::vector<Op> &proof,
        size_t const remaining_depth, bool const is_leftmost)
    {
        auto const &tree = walker.tree();
        if (remaining_depth == 0) {
            // the leftmost subtree is covered by the height proof
            if (!is_leftmost) {
                proof.emplace_back(Push{Hash{tree.hash()}});
            }
            return success();
        }

        BOOST_OUTCOME_TRY(auto const maybe_left, walker.walk(true));
        if (maybe_left.has_value()) {
            BOOST_OUTCOME_TRY(traverse_for_trunk(
                *maybe_left, proof, remaining_depth - 1, is_leftmost));
        }

        proof.emplace_back(
            Push{KV{byte_string{tree.key()}, byte_string{tree.value()}}});

        if (maybe_left.has_value()) {
            proof.emplace_back(Parent{});
        }

        BOOST_OUTCOME_TRY(auto const maybe_right, walker.walk(false));
        if (maybe_right.has_value()) {
            BOOST_OUTCOME_TRY(traverse_for_trunk(
                *maybe_right, proof, remaining_depth - 1, false));
            proof.emplace_back(Child{});
        }

        return success();
    }

    Result<size_t> verify_height_proof(ProofTree const &tree)
    {
        auto const *const left = tree.child(true);
        if (left == nullptr) {
            return 1;
        }
        if (MERK_UNLIKELY(std::holds_alternative<Hash>(left->node()))) {
            return ProofError::HeightProofContainsHash;
        }
        BOOST_OUTCOME_TRY(auto const height, verify_height_proof(*left));
        return height + 1;
    }

    Result<void> verify_completeness(
        ProofTree const &tree, size_t const remaining_depth,
        bool const leftmost)
    {
        if (remaining_depth > 0) {
            if (MERK_UNLIKELY(!std::holds_alternative<KV>(tree.node()))) {
                return ProofError::TrunkInnerNodeNotKV;
            }
            if (auto const *const left = tree.child(true)) {
                BOOST_OUTCOME_TRY(
                    verify_completeness(*left, remaining_depth - 1, leftmost));
            }
            if (auto const *const right = tree.child(false)) {
                BOOST_OUTCOME_TRY(
                    verify_completeness(*right, remaining_depth - 1, false));
            }
            return success();
        }
        if (!leftmost) {
            if (MERK_UNLIKELY(!std::holds_alternative<Hash>(tree.node()))) {
                return ProofError::TrunkLeafNotHash;
            }
            return success();
        }
        if (MERK_UNLIKELY(!std::holds_alternative<KVHash>(tree.node()))) {
            return ProofError::TrunkLeftmostLeafNotKVHash;
        }
        return success();
    }
}

Result<TrunkProof> create_trunk_proof(Walker const &root)
{
    std::vector<Op> proof;

    BOOST_OUTCOME_TRY(
        auto const trunk_height, traverse_for_height_proof(root, proof, 1));

    if (trunk_height < MIN_TRUNK_HEIGHT) {
        proof.clear();
        BOOST_OUTCOME_TRY(traverse_for_trunk(
            root, proof, std::numeric_limits<size_t>::max(), true));
        return TrunkProof{.ops = std::move(proof), .has_more = false};
    }

    BOOST_OUTCOME_TRY(traverse_for_trunk(root, proof, trunk_height, true));
    return TrunkProof{.ops = std::move(proof), .has_more = true};
}

Result<std::vector<Op>>
get_next_chunk(Cursor &cursor, std::optional<byte_string_view> const end_key)
{
    std::vector<Op> chunk;
    // right children whose subtree is still open
    std::vector<byte_string> stack;

    while (cursor.valid()) {
        auto const key = cursor.key();
        if (end_key.has_value() && key == *end_key) {
            break;
        }

        BOOST_OUTCOME_TRY(auto const node, Tree::decode(key, cursor.value()));
        chunk.emplace_back(
            Push{KV{byte_string{key}, byte_string{node->value()}}});

        if (node->link(true).has_value()) {
            chunk.emplace_back(Parent{});
        }

        if (auto const &right = node->link(false); right.has_value()) {
            stack.push_back(right->key);
        }
        else {
            while (!stack.empty() && key >= byte_string_view{stack.back()}) {
                stack.pop_back();
                chunk.emplace_back(Child{});
            }
        }

        cursor.next();
    }
    BOOST_OUTCOME_TRY(cursor.status());

    if (cursor.valid()) {
        cursor.next();
        BOOST_OUTCOME_TRY(cursor.status());
    }

    return chunk;
}

Result<VerifiedTrunk> verify_trunk(Decoder ops)
{
    bool kv_only = true;
    BOOST_OUTCOME_TRY(
        auto tree,
        execute(std::move(ops), [&kv_only](Node const &node) -> Result<void> {
            kv_only = kv_only && std::holds_alternative<KV>(node);
            return success();
        }));

    BOOST_OUTCOME_TRY(auto const height, verify_height_proof(*tree));
    size_t const trunk_height = height / 2;

    if (trunk_height < MIN_TRUNK_HEIGHT) {
        if (MERK_UNLIKELY(!kv_only)) {
            return ProofError::IncompleteLeafChunk;
        }
    }
    else {
        BOOST_OUTCOME_TRY(verify_completeness(*tree, trunk_height, true));
    }

    return VerifiedTrunk{.tree = std::move(tree), .height = height};
}

std::vector<hash_t> leaf_chunk_hashes(VerifiedTrunk const &trunk)
{
    std::vector<hash_t> hashes;
    size_t const trunk_height = trunk.height / 2;
    if (trunk_height < MIN_TRUNK_HEIGHT) {
        return hashes;
    }
    for (auto const *const node : trunk.tree->layer(trunk_height)) {
        hashes.push_back(node->hash());
    }
    return hashes;
}

Result<std::unique_ptr<ProofTree>>
verify_leaf(Decoder ops, hash_t const &expected_hash)
{
    BOOST_OUTCOME_TRY(
        auto tree,
        execute(std::move(ops), [](Node const &node) -> Result<void> {
            if (MERK_UNLIKELY(!std::holds_alternative<KV>(node))) {
                return ProofError::IncompleteLeafChunk;
            }
            return success();
        }));

    if (MERK_UNLIKELY(tree->hash() != expected_hash)) {
        return ProofError::HashMismatch;
    }
    return tree;
}

MERK_PROOFS_NAMESPACE_END
