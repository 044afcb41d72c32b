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

#include <initializer_list>

MERK_PROOFS_NAMESPACE_BEGIN

enum class ProofError
{
    Success = 0,
    InputTooShort,
    UnknownOp,
    StackUnderflow,
    UnexpectedStackSize,
    IncorrectKeyOrdering,
    AttachToHashNode,
    ChildAlreadyAttached,
    HeightProofContainsHash,
    TrunkInnerNodeNotKV,
    TrunkLeafNotHash,
    TrunkLeftmostLeafNotKVHash,
    IncompleteLeafChunk,
    HashMismatch,
};

MERK_PROOFS_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<merk::proofs::ProofError>
    : quick_status_code_from_enum_defaults<merk::proofs::ProofError>
{
    static constexpr auto const domain_name = "Merk Proof Error";
    static constexpr auto const domain_uuid =
        "b7e2c4d1-0a9f-4e38-9c61-7d5f2e8a3b14";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
