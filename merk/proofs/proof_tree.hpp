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

#include <merk/core/result.hpp>
#include <merk/proofs/config.hpp>
#include <merk/proofs/encoding.hpp>
#include <merk/proofs/op.hpp>
#include <merk/tree/hash.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <vector>

MERK_PROOFS_NAMESPACE_BEGIN

// Partial tree reconstructed by replaying a proof
class ProofTree
{
    Node node_;
    std::unique_ptr<ProofTree> left_;
    std::unique_ptr<ProofTree> right_;
    size_t height_;

public:
    explicit ProofTree(Node node);

    Node const &node() const
    {
        return node_;
    }

    ProofTree const *child(bool const left) const
    {
        return left ? left_.get() : right_.get();
    }

    size_t height() const
    {
        return height_;
    }

    hash_t hash() const;

    Result<void> attach(bool left, std::unique_ptr<ProofTree> child);

    // Nodes at `depth` from left to right, the root is at depth 0
    std::vector<ProofTree const *> layer(size_t depth) const;
};

using VisitNode = std::function<Result<void>(Node const &)>;

// Replays `ops`, calling `visit_node` for every pushed node. The result must
// be a single tree.
Result<std::unique_ptr<ProofTree>>
execute(std::span<Op const> ops, VisitNode const &visit_node = {});

Result<std::unique_ptr<ProofTree>>
execute(Decoder ops, VisitNode const &visit_node = {});

MERK_PROOFS_NAMESPACE_END
