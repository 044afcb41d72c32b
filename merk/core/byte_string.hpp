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

#include <cstddef>
#include <string>
#include <string_view>

MERK_NAMESPACE_BEGIN

using byte_string = std::basic_string<unsigned char>;

using byte_string_view = std::basic_string_view<unsigned char>;

inline byte_string_view to_byte_string_view(std::string_view const s)
{
    return byte_string_view{
        reinterpret_cast<unsigned char const *>(s.data()), s.size()};
}

inline std::string_view to_string_view(byte_string_view const s)
{
    return std::string_view{reinterpret_cast<char const *>(s.data()), s.size()};
}

std::string to_hex(byte_string_view);

MERK_NAMESPACE_END
