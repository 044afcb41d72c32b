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

#include <merk/core/config.hpp>
#include <merk/core/result.hpp>

#include <initializer_list>

MERK_NAMESPACE_BEGIN

enum class ChunkError
{
    Success = 0,
    IndexOutOfBounds,
};

MERK_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<merk::ChunkError>
    : quick_status_code_from_enum_defaults<merk::ChunkError>
{
    static constexpr auto const domain_name = "Merk Chunk Error";
    static constexpr auto const domain_uuid =
        "e7b42d96-0c1f-4a38-b5e2-8d6f13a9c074";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
