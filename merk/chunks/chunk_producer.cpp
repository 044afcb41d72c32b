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

#include <merk/chunks/chunk_producer.hpp>
#include <merk/chunks/error.hpp>
#include <merk/core/assert.h>
#include <merk/core/byte_string.hpp>
#include <merk/core/config.hpp>
#include <merk/core/likely.h>
#include <merk/core/result.hpp>
#include <merk/proofs/chunk.hpp>
#include <merk/proofs/encoding.hpp>
#include <merk/proofs/op.hpp>
#include <merk/store/cursor.hpp>
#include <merk/store/snapshot.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

MERK_NAMESPACE_BEGIN

ChunkProducer::ChunkProducer(
    std::shared_ptr<Snapshot const> snapshot, std::vector<proofs::Op> trunk,
    std::vector<byte_string> boundary_keys, std::unique_ptr<Cursor> cursor)
    : snapshot_{std::move(snapshot)}
    , trunk_{std::move(trunk)}
    , boundary_keys_{std::move(boundary_keys)}
    , cursor_{std::move(cursor)}
    , state_{AtTrunk{}}
{
}

ChunkProducer::ChunkProducer(ChunkProducer &&) noexcept = default;

ChunkProducer::~ChunkProducer() = default;

Result<ChunkProducer>
ChunkProducer::create(std::shared_ptr<Snapshot const> snapshot)
{
    MERK_ASSERT(snapshot != nullptr);

    proofs::TrunkProof trunk{.ops = {}, .has_more = false};
    if (auto const walker = snapshot->walker(); walker.has_value()) {
        auto proof = proofs::create_trunk_proof(*walker);
        if (MERK_UNLIKELY(!proof)) {
            LOG_ERROR(
                "failed to build trunk: {}", proof.error().message().c_str());
            return std::move(proof).as_failure();
        }
        trunk = std::move(proof).value();
    }

    std::vector<byte_string> boundary_keys;
    if (trunk.has_more) {
        for (auto const &op : trunk.ops) {
            auto const *const push = std::get_if<proofs::Push>(&op);
            if (push == nullptr) {
                continue;
            }
            if (auto const *const kv = std::get_if<proofs::KV>(&push->node)) {
                boundary_keys.push_back(kv->key);
            }
        }
    }

    auto cursor = snapshot->cursor();
    cursor->seek_to_first();
    BOOST_OUTCOME_TRY(cursor->status());

    LOG_DEBUG(
        "chunk producer for root {}: {} trunk ops, {} boundary keys",
        to_hex(snapshot->root_hash()),
        trunk.ops.size(),
        boundary_keys.size());

    return ChunkProducer{
        std::move(snapshot),
        std::move(trunk.ops),
        std::move(boundary_keys),
        std::move(cursor)};
}

size_t ChunkProducer::current_index() const
{
    if (std::holds_alternative<AtTrunk>(state_)) {
        return 0;
    }
    if (auto const *const leaf = std::get_if<AtLeafChunk>(&state_)) {
        return leaf->index;
    }
    return size();
}

void ChunkProducer::set_index(size_t const index)
{
    if (index == 0) {
        state_ = AtTrunk{};
    }
    else if (index < size()) {
        state_ = AtLeafChunk{index};
    }
    else {
        state_ = Exhausted{};
    }
}

Result<byte_string> ChunkProducer::chunk(size_t const index)
{
    if (MERK_UNLIKELY(index >= size())) {
        return ChunkError::IndexOutOfBounds;
    }

    if (index < 2) {
        cursor_->seek_to_first();
    }
    else {
        cursor_->seek(boundary_keys_[index - 2]);
        if (cursor_->valid()) {
            cursor_->next();
        }
    }
    BOOST_OUTCOME_TRY(cursor_->status());

    set_index(index);
    return next_chunk();
}

Result<byte_string> ChunkProducer::next_chunk()
{
    if (std::holds_alternative<Exhausted>(state_)) {
        MERK_ABORT("next_chunk called on an exhausted chunk producer");
    }

    if (std::holds_alternative<AtTrunk>(state_)) {
        set_index(1);
        return proofs::encode(trunk_);
    }

    size_t const index = std::get<AtLeafChunk>(state_).index;
    MERK_DEBUG_ASSERT(index >= 1);

    std::optional<byte_string_view> end_key;
    if (index - 1 < boundary_keys_.size()) {
        end_key = boundary_keys_[index - 1];
    }

    auto ops = proofs::get_next_chunk(*cursor_, end_key);
    if (MERK_UNLIKELY(!ops)) {
        LOG_ERROR(
            "failed to build chunk {}: {}",
            index,
            ops.error().message().c_str());
        // cursor position is unknown
        state_ = Exhausted{};
        return std::move(ops).as_failure();
    }

    set_index(index + 1);
    return proofs::encode(ops.value());
}

ChunkIter ChunkProducer::into_iter() &&
{
    return ChunkIter{std::move(*this)};
}

ChunkIter::ChunkIter(ChunkProducer &&producer)
    : producer_{std::move(producer)}
{
}

std::optional<Result<byte_string>> ChunkIter::next()
{
    if (producer_.current_index() >= producer_.size()) {
        return std::nullopt;
    }
    return producer_.next_chunk();
}

MERK_NAMESPACE_END
