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
#include <merk/core/byte_string.hpp>
#include <merk/core/config.hpp>
#include <merk/tree/hash.hpp>

#include <boost/endian/conversion.hpp>

#include <ethash/keccak.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <limits>

MERK_NAMESPACE_BEGIN

namespace
{
    void append_be32(byte_string &out, size_t const n)
    {
        MERK_ASSERT(n <= std::numeric_limits<uint32_t>::max());
        unsigned char be[sizeof(uint32_t)];
        boost::endian::store_big_u32(be, static_cast<uint32_t>(n));
        out.append(be, sizeof(be));
    }

    hash_t keccak256(byte_string_view const data)
    {
        auto const hashed = ethash::keccak256(data.data(), data.size());
        hash_t result;
        static_assert(sizeof(hashed.bytes) == HASH_LENGTH);
        std::memcpy(result.data(), hashed.bytes, HASH_LENGTH);
        return result;
    }
}

hash_t kv_hash(byte_string_view const key, byte_string_view const value)
{
    byte_string buf;
    buf.reserve(8 + key.size() + value.size());
    append_be32(buf, key.size());
    buf += key;
    append_be32(buf, value.size());
    buf += value;
    return keccak256(buf);
}

hash_t node_hash(hash_t const &kv, hash_t const &left, hash_t const &right)
{
    std::array<unsigned char, HASH_LENGTH * 3> buf;
    std::memcpy(buf.data(), kv.data(), HASH_LENGTH);
    std::memcpy(buf.data() + HASH_LENGTH, left.data(), HASH_LENGTH);
    std::memcpy(buf.data() + 2 * HASH_LENGTH, right.data(), HASH_LENGTH);
    return keccak256(byte_string_view{buf.data(), buf.size()});
}

MERK_NAMESPACE_END
