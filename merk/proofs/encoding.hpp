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
#include <merk/core/result.hpp>
#include <merk/proofs/config.hpp>
#include <merk/proofs/op.hpp>

#include <span>
#include <vector>

MERK_PROOFS_NAMESPACE_BEGIN

// Op encoding, self-delimiting so a proof is a plain concatenation:
//
//   0x01 hash[32]                           Push(Hash)
//   0x02 hash[32]                           Push(KVHash)
//   0x03 u8 |key| key be16 |value| value    Push(KV)
//   0x10                                    Parent
//   0x11                                    Child
inline constexpr unsigned char OP_PUSH_HASH = 0x01;
inline constexpr unsigned char OP_PUSH_KV_HASH = 0x02;
inline constexpr unsigned char OP_PUSH_KV = 0x03;
inline constexpr unsigned char OP_PARENT = 0x10;
inline constexpr unsigned char OP_CHILD = 0x11;

void encode_into(Op const &, byte_string &);

byte_string encode(std::span<Op const>);

// Consumes one op from the front of `enc`
Result<Op> decode_op(byte_string_view &enc);

Result<std::vector<Op>> decode(byte_string_view);

// Yields the ops of an encoded proof one at a time
class Decoder
{
    byte_string_view rest_;

public:
    explicit Decoder(byte_string_view const enc)
        : rest_{enc}
    {
    }

    bool done() const
    {
        return rest_.empty();
    }

    Result<Op> next()
    {
        return decode_op(rest_);
    }
};

MERK_PROOFS_NAMESPACE_END
