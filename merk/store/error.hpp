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

enum class StoreError
{
    Success = 0,
    NotFound,
    Corruption,
    IoError,
    InvalidArgument,
    Other,
};

MERK_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<merk::StoreError>
    : quick_status_code_from_enum_defaults<merk::StoreError>
{
    static constexpr auto const domain_name = "Merk Store Error";
    static constexpr auto const domain_uuid =
        "a3c81e0f-62d4-47b9-9e15-7b0d24f6c8a1";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
