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
#include <merk/proofs/chunk.hpp>
#include <merk/proofs/encoding.hpp>
#include <merk/proofs/op.hpp>
#include <merk/store/merk.hpp>
#include <merk/test/batch.hpp>
#include <merk/test/temp_merk.hpp>
#include <merk/tree/error.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/ops.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <utility>
#include <variant>
#include <vector>

using namespace merk;
using namespace merk::test;

namespace
{
    ChunkProducer make_producer(Merk const &merk)
    {
        auto res = merk.chunks();
        MERK_ASSERT(res.has_value());
        return std::move(res).value();
    }

    std::vector<byte_string> collect(ChunkIter iter)
    {
        std::vector<byte_string> chunks;
        while (auto chunk = iter.next()) {
            EXPECT_TRUE(chunk->has_value());
            chunks.push_back(std::move(*chunk).value());
        }
        return chunks;
    }

    // Key-value pairs pushed by a chunk, in proof order
    std::vector<proofs::KV> pushed_kvs(byte_string_view const chunk)
    {
        std::vector<proofs::KV> kvs;
        auto ops = proofs::decode(chunk);
        EXPECT_TRUE(ops.has_value());
        for (auto &op : ops.value()) {
            if (auto *const push = std::get_if<proofs::Push>(&op)) {
                if (auto *const kv = std::get_if<proofs::KV>(&push->node)) {
                    kvs.push_back(std::move(*kv));
                }
            }
        }
        return kvs;
    }
}

TEST(ChunkProducer, len_small)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 256)).has_value());
    auto const producer = make_producer(*merk);
    EXPECT_EQ(producer.size(), 1);
    EXPECT_TRUE(producer.boundary_keys().empty());
}

TEST(ChunkProducer, len_big)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());
    auto const producer = make_producer(*merk);
    EXPECT_EQ(producer.size(), 129);
    EXPECT_EQ(producer.boundary_keys().size(), 127);
    EXPECT_TRUE(std::ranges::is_sorted(producer.boundary_keys()));
}

TEST(ChunkProducer, empty_tree)
{
    TempMerk merk;
    auto producer = make_producer(*merk);
    EXPECT_EQ(producer.size(), 1);

    auto const chunk = producer.chunk(0);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_TRUE(chunk.value().empty());

    auto const chunks = collect(std::move(producer).into_iter());
    ASSERT_EQ(chunks.size(), 1);
    EXPECT_TRUE(chunks[0].empty());
}

TEST(ChunkProducer, small_tree_single_chunk_is_whole_tree)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 111)).has_value());
    auto producer = make_producer(*merk);
    ASSERT_EQ(producer.size(), 1);

    auto const chunk = producer.chunk(0);
    ASSERT_TRUE(chunk.has_value());
    auto const trunk = proofs::verify_trunk(proofs::Decoder{chunk.value()});
    ASSERT_TRUE(trunk.has_value());
    EXPECT_EQ(trunk.value().tree->hash(), merk->root_hash());
    EXPECT_TRUE(proofs::leaf_chunk_hashes(trunk.value()).empty());
}

TEST(ChunkProducer, generate_and_verify_chunks)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());

    auto iter = make_producer(*merk).into_iter();
    EXPECT_EQ(iter.size_hint(), 129);
    auto const chunks = collect(std::move(iter));
    ASSERT_EQ(chunks.size(), 129);

    auto const trunk = proofs::verify_trunk(proofs::Decoder{chunks[0]});
    ASSERT_TRUE(trunk.has_value());
    EXPECT_EQ(trunk.value().height, 14);
    EXPECT_EQ(trunk.value().tree->hash(), merk->root_hash());

    auto const expected = proofs::leaf_chunk_hashes(trunk.value());
    ASSERT_EQ(expected.size(), 128);
    for (size_t i = 1; i < chunks.size(); ++i) {
        auto const leaf =
            proofs::verify_leaf(proofs::Decoder{chunks[i]}, expected[i - 1]);
        ASSERT_TRUE(leaf.has_value()) << i;
    }

    // leaf chunks interleaved with the boundary entries of the trunk
    // reproduce every stored entry in order
    auto const boundaries = pushed_kvs(chunks[0]);
    ASSERT_EQ(boundaries.size(), 127);
    std::vector<proofs::KV> entries;
    for (size_t i = 1; i < chunks.size(); ++i) {
        for (auto &kv : pushed_kvs(chunks[i])) {
            entries.push_back(std::move(kv));
        }
        if (i - 1 < boundaries.size()) {
            entries.push_back(boundaries[i - 1]);
        }
    }
    auto const batch = make_batch_seq(1, 10000);
    ASSERT_EQ(entries.size(), batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        EXPECT_EQ(entries[i].key, batch[i].first) << i;
        EXPECT_EQ(entries[i].value, std::get<Put>(batch[i].second).value) << i;
    }
}

TEST(ChunkProducer, repeated_requests_return_same_bytes)
{
    for (uint64_t const entries : {uint64_t{110}, uint64_t{10000}}) {
        TempMerk merk;
        ASSERT_TRUE(merk->apply(make_batch_seq(1, entries + 1)).has_value());
        auto producer = make_producer(*merk);

        // every index twice, interleaved in a pseudo-random order
        std::vector<size_t> indices;
        for (size_t i = 0; i < producer.size(); ++i) {
            indices.push_back(i);
            indices.push_back(i);
        }
        std::ranges::shuffle(indices, std::mt19937{7});

        std::map<size_t, byte_string> first;
        for (auto const i : indices) {
            auto chunk = producer.chunk(i);
            ASSERT_TRUE(chunk.has_value()) << entries << " " << i;
            auto const [it, inserted] =
                first.emplace(i, chunk.value());
            if (!inserted) {
                EXPECT_EQ(chunk.value(), it->second) << entries << " " << i;
            }
        }
        EXPECT_EQ(first.size(), producer.size());
    }
}

TEST(ChunkProducer, random_access)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());

    auto const sequential = collect(make_producer(*merk).into_iter());
    ASSERT_EQ(sequential.size(), 129);

    auto producer = make_producer(*merk);
    std::vector<size_t> indices(producer.size());
    for (size_t i = 0; i < indices.size(); ++i) {
        indices[i] = i;
    }
    std::ranges::shuffle(indices, std::mt19937{42});
    for (auto const i : indices) {
        auto const chunk = producer.chunk(i);
        ASSERT_TRUE(chunk.has_value()) << i;
        EXPECT_EQ(chunk.value(), sequential[i]) << i;
    }

    // repeated and descending requests
    for (size_t const i : {size_t{5}, size_t{5}, size_t{128}, size_t{1}, size_t{0}, size_t{2}}) {
        auto const chunk = producer.chunk(i);
        ASSERT_TRUE(chunk.has_value()) << i;
        EXPECT_EQ(chunk.value(), sequential[i]) << i;
    }
}

TEST(ChunkProducer, random_access_then_iterate)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 5000)).has_value());
    auto const sequential = collect(make_producer(*merk).into_iter());

    // iteration continues from the index after the last random access
    auto producer = make_producer(*merk);
    ASSERT_GT(producer.size(), 10);
    ASSERT_TRUE(producer.chunk(7).has_value());
    auto iter = std::move(producer).into_iter();
    for (size_t i = 8; i < sequential.size(); ++i) {
        auto chunk = iter.next();
        ASSERT_TRUE(chunk.has_value()) << i;
        ASSERT_TRUE(chunk->has_value()) << i;
        EXPECT_EQ(chunk->value(), sequential[i]) << i;
    }
    EXPECT_FALSE(iter.next().has_value());
}

TEST(ChunkProducer, index_out_of_bounds)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());
    auto producer = make_producer(*merk);

    for (size_t const i : {producer.size(), producer.size() + 1, size_t{1000}}) {
        auto const res = producer.chunk(i);
        ASSERT_TRUE(res.has_error()) << i;
        EXPECT_EQ(res.error(), ChunkError::IndexOutOfBounds);
    }

    // still usable
    EXPECT_TRUE(producer.chunk(producer.size() - 1).has_value());

    TempMerk empty;
    auto empty_producer = make_producer(*empty);
    EXPECT_EQ(empty_producer.chunk(1).error(), ChunkError::IndexOutOfBounds);
}

TEST(ChunkProducer, iterator_exhaustion)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 3000)).has_value());
    auto iter = make_producer(*merk).into_iter();
    auto const total = iter.size_hint();
    ASSERT_GT(total, 1);

    size_t count = 0;
    while (auto chunk = iter.next()) {
        ASSERT_TRUE(chunk->has_value());
        ++count;
        // total, not remaining
        EXPECT_EQ(iter.size_hint(), total);
    }
    EXPECT_EQ(count, total);
    EXPECT_FALSE(iter.next().has_value());
    EXPECT_FALSE(iter.next().has_value());
    EXPECT_EQ(iter.size_hint(), total);
}

TEST(ChunkProducer, chunks_from_reopen)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());
    auto const expected_chunks = collect(make_producer(*merk).into_iter());

    merk.reopen();
    auto const reopened = collect(make_producer(*merk).into_iter());
    EXPECT_EQ(reopened, expected_chunks);
}

TEST(ChunkProducer, chunks_from_checkpoint)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());
    auto const expected_chunks = collect(make_producer(*merk).into_iter());

    auto res = merk->checkpoint(make_temp_path());
    ASSERT_TRUE(res.has_value());
    auto checkpoint = std::move(res).value();
    {
        auto const from_checkpoint =
            collect(make_producer(checkpoint).into_iter());
        EXPECT_EQ(from_checkpoint, expected_chunks);
    }
    EXPECT_TRUE(std::move(checkpoint).destroy().has_value());
}

TEST(ChunkProducer, snapshot_isolation)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());
    auto const before = collect(make_producer(*merk).into_iter());

    {
        auto producer = make_producer(*merk);
        ASSERT_TRUE(merk->apply(make_batch_seq(10000, 12000)).has_value());
        ASSERT_TRUE(merk->apply(make_del_batch_seq(1, 500)).has_value());

        EXPECT_EQ(producer.size(), before.size());
        for (size_t i = 0; i < before.size(); ++i) {
            auto const chunk = producer.chunk(i);
            ASSERT_TRUE(chunk.has_value()) << i;
            EXPECT_EQ(chunk.value(), before[i]) << i;
        }
    }

    auto const after = collect(make_producer(*merk).into_iter());
    EXPECT_NE(after, before);
}

TEST(ChunkProducer, producers_share_snapshot)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());
    auto const expected = collect(make_producer(*merk).into_iter());

    {
        auto snapshot = merk->snapshot();
        ASSERT_TRUE(snapshot.has_value());
        auto a = ChunkProducer::create(snapshot.value());
        auto b = ChunkProducer::create(std::move(snapshot).value());
        ASSERT_TRUE(a.has_value());
        ASSERT_TRUE(b.has_value());

        // interleaved use does not disturb either cursor
        for (size_t i = 0; i < expected.size(); ++i) {
            auto const from_a = a.value().chunk(i);
            auto const from_b = b.value().chunk(expected.size() - 1 - i);
            ASSERT_TRUE(from_a.has_value());
            ASSERT_TRUE(from_b.has_value());
            EXPECT_EQ(from_a.value(), expected[i]);
            EXPECT_EQ(from_b.value(), expected[expected.size() - 1 - i]);
        }
    }
}

TEST(ChunkProducer, random_keys)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_rand(4000, 3)).has_value());
    ASSERT_TRUE(merk->apply(make_batch_rand(4000, 4)).has_value());

    auto const chunks = collect(make_producer(*merk).into_iter());
    auto const trunk = proofs::verify_trunk(proofs::Decoder{chunks[0]});
    ASSERT_TRUE(trunk.has_value());
    EXPECT_EQ(trunk.value().tree->hash(), merk->root_hash());
    auto const expected = proofs::leaf_chunk_hashes(trunk.value());
    ASSERT_EQ(expected.size() + 1, chunks.size());
    for (size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_TRUE(
            proofs::verify_leaf(proofs::Decoder{chunks[i]}, expected[i - 1])
                .has_value())
            << i;
    }
}

TEST(ChunkProducer, corrupt_leaf_node_fails_chunk)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());
    merk.close();
    // the greatest key sits at the bottom of the last leaf chunk
    overwrite_node(merk.path(), make_key(9999), byte_string{0x07});
    merk.reopen();

    auto producer = make_producer(*merk);
    ASSERT_EQ(producer.size(), 129);
    EXPECT_TRUE(producer.chunk(1).has_value());

    auto const res = producer.chunk(producer.size() - 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), TreeError::InvalidNodeEncoding);

    auto iter = std::move(producer).into_iter();
    EXPECT_FALSE(iter.next().has_value());
}

TEST(ChunkProducer, corrupt_leaf_node_ends_iteration)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());
    merk.close();
    overwrite_node(merk.path(), make_key(9999), byte_string{0x07});
    merk.reopen();

    auto iter = make_producer(*merk).into_iter();
    auto const total = iter.size_hint();
    for (size_t i = 0; i + 1 < total; ++i) {
        auto chunk = iter.next();
        ASSERT_TRUE(chunk.has_value()) << i;
        ASSERT_TRUE(chunk->has_value()) << i;
    }
    auto const failed = iter.next();
    ASSERT_TRUE(failed.has_value());
    ASSERT_TRUE(failed->has_error());
    EXPECT_EQ(failed->error(), TreeError::InvalidNodeEncoding);
    EXPECT_FALSE(iter.next().has_value());
    EXPECT_FALSE(iter.next().has_value());
}

TEST(ChunkProducer, corrupt_trunk_node_fails_construction)
{
    TempMerk merk;
    ASSERT_TRUE(merk->apply(make_batch_seq(1, 10000)).has_value());
    ASSERT_NE(merk->root(), nullptr);
    auto const &left = merk->root()->link(true);
    ASSERT_TRUE(left.has_value());
    byte_string const key = left->key;
    merk.close();
    overwrite_node(merk.path(), key, byte_string{0x07});
    merk.reopen();

    auto const res = merk->chunks();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), TreeError::InvalidNodeEncoding);
}
