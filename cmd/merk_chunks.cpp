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
#include <merk/core/assert.h>
#include <merk/core/byte_string.hpp>
#include <merk/core/log_level_map.hpp>
#include <merk/core/result.hpp>
#include <merk/proofs/chunk.hpp>
#include <merk/proofs/encoding.hpp>
#include <merk/proofs/error.hpp>
#include <merk/store/error.hpp>
#include <merk/store/merk.hpp>
#include <merk/store/merk_config.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/ops.hpp>

#include <CLI/CLI.hpp>

#include <boost/endian/conversion.hpp>
#include <boost/outcome/try.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using namespace merk;

namespace
{
    struct FillOptions
    {
        uint64_t count{10'000};
        uint64_t start{0};
        size_t value_size{60};
        bool random{false};
        uint64_t seed{0};
    };

    struct DumpOptions
    {
        fs::path out;
        std::vector<size_t> indices;
    };

    byte_string encode_key(uint64_t const n)
    {
        auto const be = boost::endian::native_to_big(n);
        return byte_string{
            reinterpret_cast<unsigned char const *>(&be), sizeof(be)};
    }

    Batch make_batch(FillOptions const &opts)
    {
        std::vector<uint64_t> keys;
        keys.reserve(opts.count);
        if (opts.random) {
            std::mt19937_64 rng{opts.seed};
            for (uint64_t i = 0; i < opts.count; ++i) {
                keys.push_back(rng());
            }
            std::ranges::sort(keys);
            keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
        }
        else {
            for (uint64_t i = 0; i < opts.count; ++i) {
                keys.push_back(opts.start + i);
            }
        }

        Batch batch;
        batch.reserve(keys.size());
        for (auto const key : keys) {
            batch.emplace_back(
                encode_key(key), Put{byte_string(opts.value_size, 123)});
        }
        return batch;
    }

    Result<void> fill(Merk &merk, FillOptions const &opts)
    {
        auto const batch = make_batch(opts);
        BOOST_OUTCOME_TRY(merk.apply(batch));
        LOG_INFO(
            "applied {} keys, root {}",
            batch.size(),
            to_hex(merk.root_hash()));
        return success();
    }

    Result<void> info(Merk const &merk)
    {
        BOOST_OUTCOME_TRY(auto const producer, merk.chunks());
        LOG_INFO(
            "root {}, height {}, {} chunks, {} boundary keys",
            to_hex(merk.root_hash()),
            merk.root() == nullptr ? 0 : merk.root()->height(),
            producer.size(),
            producer.boundary_keys().size());
        return success();
    }

    Result<void> write_chunk(
        fs::path const &dir, size_t const index, byte_string const &chunk)
    {
        auto const path = dir / ("chunk_" + std::to_string(index) + ".bin");
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        out.write(reinterpret_cast<char const *>(chunk.data()),
                  static_cast<std::streamsize>(chunk.size()));
        if (!out) {
            LOG_ERROR("failed to write {}", path.string());
            return StoreError::IoError;
        }
        LOG_DEBUG("wrote {} bytes to {}", chunk.size(), path.string());
        return success();
    }

    Result<void> dump(Merk const &merk, DumpOptions const &opts)
    {
        fs::create_directories(opts.out);
        BOOST_OUTCOME_TRY(auto producer, merk.chunks());
        if (!opts.indices.empty()) {
            for (auto const index : opts.indices) {
                BOOST_OUTCOME_TRY(auto const chunk, producer.chunk(index));
                BOOST_OUTCOME_TRY(write_chunk(opts.out, index, chunk));
            }
            return success();
        }

        auto iter = std::move(producer).into_iter();
        size_t index = 0;
        while (auto chunk = iter.next()) {
            BOOST_OUTCOME_TRY(auto const bytes, std::move(*chunk));
            BOOST_OUTCOME_TRY(write_chunk(opts.out, index++, bytes));
        }
        LOG_INFO("wrote {} chunks to {}", index, opts.out.string());
        return success();
    }

    Result<void> verify(Merk const &merk)
    {
        if (merk.root() == nullptr) {
            LOG_INFO("tree is empty, nothing to verify");
            return success();
        }
        BOOST_OUTCOME_TRY(auto producer, merk.chunks());
        auto iter = std::move(producer).into_iter();

        auto first = iter.next();
        MERK_ASSERT(first.has_value());
        BOOST_OUTCOME_TRY(auto const trunk_bytes, std::move(*first));
        BOOST_OUTCOME_TRY(
            auto const trunk, proofs::verify_trunk(proofs::Decoder{trunk_bytes}));
        if (trunk.tree->hash() != merk.root_hash()) {
            LOG_ERROR(
                "trunk hash {} does not match root {}",
                to_hex(trunk.tree->hash()),
                to_hex(merk.root_hash()));
            return proofs::ProofError::HashMismatch;
        }

        auto const expected = proofs::leaf_chunk_hashes(trunk);
        MERK_ASSERT(expected.size() + 1 == iter.size_hint());
        size_t verified = 0;
        while (auto chunk = iter.next()) {
            BOOST_OUTCOME_TRY(auto const bytes, std::move(*chunk));
            BOOST_OUTCOME_TRY(proofs::verify_leaf(
                proofs::Decoder{bytes}, expected[verified]));
            ++verified;
        }
        LOG_INFO(
            "verified trunk of height {} and {} leaf chunks",
            trunk.height,
            verified);
        return success();
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"merk_chunks"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    fs::path db_path;
    auto log_level = quill::LogLevel::Info;
    MerkConfig config;
    FillOptions fill_opts;
    DumpOptions dump_opts;

    cli.add_option("--db", db_path, "merk database directory")->required();
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_option(
        "--parallelism",
        config.parallelism,
        "rocksdb background threads");
    cli.add_option(
        "--max_open_files",
        config.max_open_files,
        "rocksdb open file limit, -1 for unlimited");

    auto *const fill_cmd =
        cli.add_subcommand("fill", "apply a batch of generated keys");
    fill_cmd->add_option("--count", fill_opts.count, "number of keys");
    fill_cmd->add_option("--start", fill_opts.start, "first sequential key");
    fill_cmd->add_option(
        "--value_size", fill_opts.value_size, "size of each value");
    fill_cmd->add_flag("--random", fill_opts.random, "use random keys");
    fill_cmd->add_option("--seed", fill_opts.seed, "random key seed");

    auto *const info_cmd =
        cli.add_subcommand("info", "print root hash and chunk count");

    auto *const dump_cmd =
        cli.add_subcommand("dump", "write chunks to a directory");
    dump_cmd->add_option("--out", dump_opts.out, "output directory")
        ->required();
    dump_cmd->add_option(
        "--index",
        dump_opts.indices,
        "chunk indices to write, all chunks in order if omitted");

    auto *const verify_cmd = cli.add_subcommand(
        "verify", "produce every chunk and verify it against the trunk");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config quill_cfg;
    quill_cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(quill_cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    config.create_if_missing = fill_cmd->parsed();
    auto merk = Merk::open(db_path, config);
    if (!merk) {
        LOG_ERROR(
            "failed to open {}: {}",
            db_path.string(),
            merk.error().message().c_str());
        return EXIT_FAILURE;
    }

    Result<void> res = success();
    if (fill_cmd->parsed()) {
        res = fill(merk.value(), fill_opts);
    }
    else if (info_cmd->parsed()) {
        res = info(merk.value());
    }
    else if (dump_cmd->parsed()) {
        res = dump(merk.value(), dump_opts);
    }
    else if (verify_cmd->parsed()) {
        res = verify(merk.value());
    }

    if (!res) {
        LOG_ERROR("failed: {}", res.error().message().c_str());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
