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
#include <merk/core/result.hpp>
#include <merk/proofs/op.hpp>
#include <merk/store/cursor.hpp>
#include <merk/store/snapshot.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

MERK_NAMESPACE_BEGIN

class ChunkIter;

// Splits a snapshot into independently verifiable chunks. Chunk 0 is the
// trunk proof. When the trunk is elided, every KV key in it bounds a leaf
// chunk, so leaf chunk i covers the stored nodes strictly between
// boundaries i - 2 and i - 1. Chunks are identical whether they are
// produced sequentially or by index.
//
// Not thread safe. Producers over the same snapshot are independent.
class ChunkProducer
{
    struct AtTrunk
    {
    };

    struct AtLeafChunk
    {
        size_t index;
    };

    struct Exhausted
    {
    };

    using State = std::variant<AtTrunk, AtLeafChunk, Exhausted>;

    std::shared_ptr<Snapshot const> snapshot_;
    std::vector<proofs::Op> trunk_;
    std::vector<byte_string> boundary_keys_;
    // reads snapshot_, declared after it
    std::unique_ptr<Cursor> cursor_;
    State state_;

    ChunkProducer(
        std::shared_ptr<Snapshot const>, std::vector<proofs::Op> trunk,
        std::vector<byte_string> boundary_keys, std::unique_ptr<Cursor>);

    size_t current_index() const;

    // Produces the chunk at the current index and moves to the next one.
    // Must not be called once exhausted.
    Result<byte_string> next_chunk();

    void set_index(size_t);

    friend class ChunkIter;

public:
    ChunkProducer(ChunkProducer &&) noexcept;
    ChunkProducer &operator=(ChunkProducer &&) = delete;
    ~ChunkProducer();

    static Result<ChunkProducer> create(std::shared_ptr<Snapshot const>);

    size_t size() const
    {
        return boundary_keys_.empty() ? 1 : boundary_keys_.size() + 2;
    }

    std::vector<byte_string> const &boundary_keys() const
    {
        return boundary_keys_;
    }

    Result<byte_string> chunk(size_t index);

    ChunkIter into_iter() &&;
};

// Yields every remaining chunk in order, then nothing. A failed chunk ends
// the iteration.
class ChunkIter
{
    ChunkProducer producer_;

public:
    explicit ChunkIter(ChunkProducer &&);

    std::optional<Result<byte_string>> next();

    // Total number of chunks, not the number remaining
    size_t size_hint() const
    {
        return producer_.size();
    }
};

MERK_NAMESPACE_END
