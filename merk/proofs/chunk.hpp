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
#include <merk/core/result.hpp>
#include <merk/proofs/config.hpp>
#include <merk/proofs/encoding.hpp>
#include <merk/proofs/op.hpp>
#include <merk/proofs/proof_tree.hpp>
#include <merk/store/cursor.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/walker.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

MERK_PROOFS_NAMESPACE_BEGIN

// Trees whose trunk would be shorter than this are sent as a single chunk
inline constexpr size_t MIN_TRUNK_HEIGHT = 5;

struct TrunkProof
{
    std::vector<Op> ops;
    // leaf chunks follow the trunk
    bool has_more;
};

// Proves the upper half of the tree. The left edge is proven first as
// KVHash nodes to commit to the tree height, then every node above half
// that height as KV with the subtrees below it as Hash nodes. Small trees
// are proven entirely as KV nodes.
Result<TrunkProof> create_trunk_proof(Walker const &root);

// Proves the stored nodes from the cursor position up to, not including,
// `end_key`, or to the end of the store. The cursor is left past `end_key`.
Result<std::vector<Op>>
get_next_chunk(Cursor &, std::optional<byte_string_view> end_key);

struct VerifiedTrunk
{
    std::unique_ptr<ProofTree> tree;
    size_t height;
};

Result<VerifiedTrunk> verify_trunk(Decoder ops);

// Expected root hashes of the leaf chunks, in chunk order. Empty when the
// trunk covers the whole tree.
std::vector<hash_t> leaf_chunk_hashes(VerifiedTrunk const &);

Result<std::unique_ptr<ProofTree>>
verify_leaf(Decoder ops, hash_t const &expected_hash);

MERK_PROOFS_NAMESPACE_END
