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
#include <merk/core/likely.h>
#include <merk/core/result.hpp>
#include <merk/proofs/config.hpp>
#include <merk/proofs/encoding.hpp>
#include <merk/proofs/error.hpp>
#include <merk/proofs/op.hpp>
#include <merk/proofs/proof_tree.hpp>
#include <merk/tree/hash.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

MERK_PROOFS_NAMESPACE_BEGIN

ProofTree::ProofTree(Node node)
    : node_{std::move(node)}
    , left_{}
    , right_{}
    , height_{1}
{
}

hash_t ProofTree::hash() const
{
    auto const child_hash = [this](bool const left) {
        auto const *const c = child(left);
        return c != nullptr ? c->hash() : NULL_HASH;
    };
    return std::visit(
        [&](auto const &n) -> hash_t {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, Hash>) {
                return n.hash;
            }
            else if constexpr (std::is_same_v<T, KVHash>) {
                return node_hash(n.hash, child_hash(true), child_hash(false));
            }
            else {
                return node_hash(
                    kv_hash(n.key, n.value), child_hash(true), child_hash(false));
            }
        },
        node_);
}

Result<void>
ProofTree::attach(bool const left, std::unique_ptr<ProofTree> child)
{
    if (MERK_UNLIKELY(std::holds_alternative<Hash>(node_))) {
        return ProofError::AttachToHashNode;
    }
    auto &slot = left ? left_ : right_;
    if (MERK_UNLIKELY(slot != nullptr)) {
        return ProofError::ChildAlreadyAttached;
    }
    height_ = std::max(height_, child->height_ + 1);
    slot = std::move(child);
    return success();
}

std::vector<ProofTree const *> ProofTree::layer(size_t const depth) const
{
    std::vector<ProofTree const *> nodes{this};
    for (size_t i = 0; i < depth; ++i) {
        std::vector<ProofTree const *> next;
        next.reserve(nodes.size() * 2);
        for (auto const *const node : nodes) {
            for (bool const left : {true, false}) {
                if (auto const *const c = node->child(left)) {
                    next.push_back(c);
                }
            }
        }
        nodes = std::move(next);
    }
    return nodes;
}

namespace
{
    class Executor
    {
        std::vector<std::unique_ptr<ProofTree>> stack_;
        std::optional<byte_string> last_key_;
        VisitNode const &visit_node_;

        Result<std::unique_ptr<ProofTree>> pop()
        {
            if (MERK_UNLIKELY(stack_.empty())) {
                return ProofError::StackUnderflow;
            }
            auto top = std::move(stack_.back());
            stack_.pop_back();
            return top;
        }

    public:
        explicit Executor(VisitNode const &visit_node)
            : visit_node_{visit_node}
        {
        }

        Result<void> step(Op const &op)
        {
            if (auto const *const push = std::get_if<Push>(&op)) {
                if (auto const *const kv = std::get_if<KV>(&push->node)) {
                    if (MERK_UNLIKELY(
                            last_key_.has_value() && kv->key <= *last_key_)) {
                        return ProofError::IncorrectKeyOrdering;
                    }
                    last_key_ = kv->key;
                }
                if (visit_node_) {
                    BOOST_OUTCOME_TRY(visit_node_(push->node));
                }
                stack_.push_back(std::make_unique<ProofTree>(push->node));
            }
            else if (std::holds_alternative<Parent>(op)) {
                BOOST_OUTCOME_TRY(auto parent, pop());
                BOOST_OUTCOME_TRY(auto child, pop());
                BOOST_OUTCOME_TRY(parent->attach(true, std::move(child)));
                stack_.push_back(std::move(parent));
            }
            else {
                BOOST_OUTCOME_TRY(auto child, pop());
                BOOST_OUTCOME_TRY(auto parent, pop());
                BOOST_OUTCOME_TRY(parent->attach(false, std::move(child)));
                stack_.push_back(std::move(parent));
            }
            return success();
        }

        Result<std::unique_ptr<ProofTree>> finish()
        {
            if (MERK_UNLIKELY(stack_.size() != 1)) {
                return ProofError::UnexpectedStackSize;
            }
            return pop();
        }
    };
}

Result<std::unique_ptr<ProofTree>>
execute(std::span<Op const> const ops, VisitNode const &visit_node)
{
    Executor executor{visit_node};
    for (auto const &op : ops) {
        BOOST_OUTCOME_TRY(executor.step(op));
    }
    return executor.finish();
}

Result<std::unique_ptr<ProofTree>>
execute(Decoder ops, VisitNode const &visit_node)
{
    Executor executor{visit_node};
    while (!ops.done()) {
        BOOST_OUTCOME_TRY(auto const op, ops.next());
        BOOST_OUTCOME_TRY(executor.step(op));
    }
    return executor.finish();
}

MERK_PROOFS_NAMESPACE_END
