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

#include <merk/proofs/error.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<merk::proofs::ProofError>::mapping> const &
quick_status_code_from_enum<merk::proofs::ProofError>::value_mappings()
{
    using merk::proofs::ProofError;

    static std::initializer_list<mapping> const v = {
        {ProofError::Success, "success", {errc::success}},
        {ProofError::InputTooShort, "input too short", {}},
        {ProofError::UnknownOp, "unknown op", {}},
        {ProofError::StackUnderflow, "stack underflow", {}},
        {ProofError::UnexpectedStackSize,
         "expected proof to result in exactly one stack item",
         {}},
        {ProofError::IncorrectKeyOrdering, "incorrect key ordering", {}},
        {ProofError::AttachToHashNode, "tried to attach to hash node", {}},
        {ProofError::ChildAlreadyAttached, "child already attached", {}},
        {ProofError::HeightProofContainsHash,
         "expected height proof to only contain kv and kv hash nodes",
         {}},
        {ProofError::TrunkInnerNodeNotKV,
         "expected trunk inner nodes to contain keys and values",
         {}},
        {ProofError::TrunkLeafNotHash,
         "expected trunk leaves to contain hash nodes",
         {}},
        {ProofError::TrunkLeftmostLeafNotKVHash,
         "expected leftmost trunk leaf to contain kv hash node",
         {}},
        {ProofError::IncompleteLeafChunk,
         "leaf chunks must contain full subtree",
         {}},
        {ProofError::HashMismatch,
         "chunk proof did not match expected hash",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
