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

#include <merk/core/byte_string.hpp>
#include <merk/core/config.hpp>

#include <string>

MERK_NAMESPACE_BEGIN

std::string to_hex(byte_string_view const bytes)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto const b : bytes) {
        result.push_back(digits[b >> 4]);
        result.push_back(digits[b & 0x0f]);
    }
    return result;
}

MERK_NAMESPACE_END
