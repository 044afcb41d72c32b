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
#include <merk/core/likely.h>
#include <merk/core/result.hpp>
#include <merk/proofs/config.hpp>
#include <merk/proofs/encoding.hpp>
#include <merk/proofs/error.hpp>
#include <merk/proofs/op.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/tree.hpp>

#include <boost/endian/conversion.hpp>
#include <boost/outcome/try.hpp>

#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>
#include <variant>
#include <vector>

MERK_PROOFS_NAMESPACE_BEGIN

namespace
{
    void encode_node(Node const &node, byte_string &out)
    {
        std::visit(
            [&out](auto const &n) {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, Hash>) {
                    out.push_back(OP_PUSH_HASH);
                    out.append(n.hash.data(), n.hash.size());
                }
                else if constexpr (std::is_same_v<T, KVHash>) {
                    out.push_back(OP_PUSH_KV_HASH);
                    out.append(n.hash.data(), n.hash.size());
                }
                else {
                    MERK_ASSERT(n.key.size() <= MAX_KEY_LENGTH);
                    MERK_ASSERT(n.value.size() <= MAX_VALUE_LENGTH);
                    out.push_back(OP_PUSH_KV);
                    out.push_back(static_cast<unsigned char>(n.key.size()));
                    out += n.key;
                    unsigned char value_len[sizeof(uint16_t)];
                    boost::endian::store_big_u16(
                        value_len, static_cast<uint16_t>(n.value.size()));
                    out.append(value_len, sizeof(value_len));
                    out += n.value;
                }
            },
            node);
    }

    Result<hash_t> decode_hash(byte_string_view &enc)
    {
        if (MERK_UNLIKELY(enc.size() < HASH_LENGTH)) {
            return ProofError::InputTooShort;
        }
        hash_t hash;
        std::memcpy(hash.data(), enc.data(), HASH_LENGTH);
        enc.remove_prefix(HASH_LENGTH);
        return hash;
    }
}

void encode_into(Op const &op, byte_string &out)
{
    std::visit(
        [&out](auto const &o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Push>) {
                encode_node(o.node, out);
            }
            else if constexpr (std::is_same_v<T, Parent>) {
                out.push_back(OP_PARENT);
            }
            else {
                out.push_back(OP_CHILD);
            }
        },
        op);
}

byte_string encode(std::span<Op const> const ops)
{
    byte_string out;
    for (auto const &op : ops) {
        encode_into(op, out);
    }
    return out;
}

Result<Op> decode_op(byte_string_view &enc)
{
    if (MERK_UNLIKELY(enc.empty())) {
        return ProofError::InputTooShort;
    }
    unsigned char const tag = enc[0];
    enc.remove_prefix(1);
    switch (tag) {
    case OP_PUSH_HASH: {
        BOOST_OUTCOME_TRY(auto const hash, decode_hash(enc));
        return Op{Push{Hash{hash}}};
    }
    case OP_PUSH_KV_HASH: {
        BOOST_OUTCOME_TRY(auto const hash, decode_hash(enc));
        return Op{Push{KVHash{hash}}};
    }
    case OP_PUSH_KV: {
        if (MERK_UNLIKELY(enc.empty())) {
            return ProofError::InputTooShort;
        }
        size_t const key_len = enc[0];
        enc.remove_prefix(1);
        if (MERK_UNLIKELY(enc.size() < key_len + 2)) {
            return ProofError::InputTooShort;
        }
        byte_string key{enc.substr(0, key_len)};
        enc.remove_prefix(key_len);
        size_t const value_len = boost::endian::load_big_u16(enc.data());
        enc.remove_prefix(2);
        if (MERK_UNLIKELY(enc.size() < value_len)) {
            return ProofError::InputTooShort;
        }
        byte_string value{enc.substr(0, value_len)};
        enc.remove_prefix(value_len);
        return Op{Push{KV{std::move(key), std::move(value)}}};
    }
    case OP_PARENT:
        return Op{Parent{}};
    case OP_CHILD:
        return Op{Child{}};
    default:
        return ProofError::UnknownOp;
    }
}

Result<std::vector<Op>> decode(byte_string_view enc)
{
    std::vector<Op> ops;
    while (!enc.empty()) {
        BOOST_OUTCOME_TRY(auto op, decode_op(enc));
        ops.emplace_back(std::move(op));
    }
    return ops;
}

MERK_PROOFS_NAMESPACE_END
