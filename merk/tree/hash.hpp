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
#include <merk/core/config.hpp>

#include <array>
#include <cstddef>
#include <string>

MERK_NAMESPACE_BEGIN

inline constexpr size_t HASH_LENGTH = 32;

using hash_t = std::array<unsigned char, HASH_LENGTH>;

// Hash of an absent child
inline constexpr hash_t NULL_HASH{};

// keccak256(be32(|key|) || key || be32(|value|) || value)
hash_t kv_hash(byte_string_view key, byte_string_view value);

// keccak256(kv || left || right)
hash_t node_hash(hash_t const &kv, hash_t const &left, hash_t const &right);

inline std::string to_hex(hash_t const &h)
{
    return to_hex(byte_string_view{h.data(), h.size()});
}

MERK_NAMESPACE_END
