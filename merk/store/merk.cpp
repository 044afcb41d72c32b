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
#include <merk/core/config.hpp>
#include <merk/core/likely.h>
#include <merk/core/result.hpp>
#include <merk/store/db.hpp>
#include <merk/store/error.hpp>
#include <merk/store/merk.hpp>
#include <merk/store/merk_config.hpp>
#include <merk/store/rocksdb_util.hpp>
#include <merk/store/snapshot.hpp>
#include <merk/tree/fetch.hpp>
#include <merk/tree/hash.hpp>
#include <merk/tree/ops.hpp>
#include <merk/tree/tree.hpp>
#include <merk/tree/walker.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/checkpoint.h>
#include <rocksdb/write_batch.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

MERK_NAMESPACE_BEGIN

namespace
{
    rocksdb::Slice const root_key_slice{
        detail::ROOT_KEY.data(), detail::ROOT_KEY.size()};

    // Reads the latest committed nodes
    class LatestFetch final : public Fetch
    {
        detail::Db const &db_;

    public:
        explicit LatestFetch(detail::Db const &db)
            : db_{db}
        {
        }

        Result<std::unique_ptr<Tree>> fetch(Link const &link) const override
        {
            return detail::read_node(db_, nullptr, link.key);
        }
    };

    class BatchCommitter final : public Committer
    {
        rocksdb::WriteBatch &batch_;
        rocksdb::ColumnFamilyHandle *cf_;
        rocksdb::Status status_;

    public:
        BatchCommitter(
            rocksdb::WriteBatch &batch, rocksdb::ColumnFamilyHandle *const cf)
            : batch_{batch}
            , cf_{cf}
        {
        }

        void write(Tree const &tree) override
        {
            if (!status_.ok()) {
                return;
            }
            auto const encoded = tree.encode();
            status_ = batch_.Put(cf_, to_slice(tree.key()), to_slice(encoded));
        }

        rocksdb::Status const &status() const
        {
            return status_;
        }
    };

    Result<void> write_aux(
        rocksdb::WriteBatch &batch, rocksdb::ColumnFamilyHandle *const cf,
        std::span<BatchEntry const> const aux)
    {
        for (auto const &[key, op] : aux) {
            if (auto const *const put = std::get_if<Put>(&op)) {
                BOOST_OUTCOME_TRY(
                    check_status(batch.Put(cf, to_slice(key), to_slice(put->value))));
            }
            else {
                BOOST_OUTCOME_TRY(check_status(batch.Delete(cf, to_slice(key))));
            }
        }
        return success();
    }
}

Merk::Merk(
    std::filesystem::path path, std::shared_ptr<detail::Db> db,
    std::unique_ptr<Tree> tree, size_t const max_batch_bytes)
    : path_{std::move(path)}
    , db_{std::move(db)}
    , tree_{std::move(tree)}
    , max_batch_bytes_{max_batch_bytes}
{
}

Merk::Merk(Merk &&) noexcept = default;
Merk &Merk::operator=(Merk &&) noexcept = default;
Merk::~Merk() = default;

Result<Merk>
Merk::open(std::filesystem::path const &path, MerkConfig const &config)
{
    BOOST_OUTCOME_TRY(auto db, detail::Db::open(path, config));
    BOOST_OUTCOME_TRY(auto root, detail::read_root(*db, nullptr));
    LOG_INFO(
        "opened merk at {}, root {}",
        path.string(),
        root == nullptr ? std::string{"empty"} : to_hex(root->hash()));
    return Merk{path, std::move(db), std::move(root), config.max_batch_bytes};
}

hash_t Merk::root_hash() const
{
    return tree_ == nullptr ? NULL_HASH : tree_->hash();
}

Result<std::optional<byte_string>> Merk::get(byte_string_view const key) const
{
    if (tree_ == nullptr) {
        return std::optional<byte_string>{};
    }
    LatestFetch const fetch{*db_};
    return MERK_NAMESPACE::get(Walker{*tree_, fetch}, key);
}

Result<std::optional<byte_string>>
Merk::get_aux(byte_string_view const key) const
{
    rocksdb::PinnableSlice value;
    auto const s = db_->db().Get(
        rocksdb::ReadOptions{}, db_->aux_cf(), to_slice(key), &value);
    if (s.IsNotFound()) {
        return std::optional<byte_string>{};
    }
    BOOST_OUTCOME_TRY(check_status(s));
    return std::optional<byte_string>{byte_string{to_view(value)}};
}

Result<void> Merk::apply(
    std::span<BatchEntry const> const batch,
    std::span<BatchEntry const> const aux)
{
    BOOST_OUTCOME_TRY(validate_batch(batch));

    std::vector<byte_string> deleted_keys;
    LatestFetch const fetch{*db_};
    auto applied = apply_to(std::move(tree_), batch, fetch, deleted_keys);
    if (!applied) {
        // the resident tree was consumed, fall back to the committed root
        BOOST_OUTCOME_TRY(auto root, detail::read_root(*db_, nullptr));
        tree_ = std::move(root);
        return std::move(applied).as_failure();
    }
    auto tree = std::move(applied).value();

    auto written = write(tree.get(), deleted_keys, aux);
    if (MERK_UNLIKELY(!written)) {
        BOOST_OUTCOME_TRY(auto root, detail::read_root(*db_, nullptr));
        tree_ = std::move(root);
        return written;
    }

    if (tree != nullptr) {
        tree->prune();
    }
    tree_ = std::move(tree);

    LOG_DEBUG(
        "applied {} ops, {} aux ops, {} nodes removed",
        batch.size(),
        aux.size(),
        deleted_keys.size());
    return success();
}

Result<void> Merk::write(
    Tree *const tree, std::span<byte_string const> const deleted_keys,
    std::span<BatchEntry const> const aux)
{
    rocksdb::WriteBatch write_batch{0, max_batch_bytes_};
    for (auto const &key : deleted_keys) {
        BOOST_OUTCOME_TRY(
            check_status(write_batch.Delete(db_->tree_cf(), to_slice(key))));
    }
    if (tree != nullptr) {
        BatchCommitter committer{write_batch, db_->tree_cf()};
        commit(*tree, committer);
        BOOST_OUTCOME_TRY(check_status(committer.status()));
        BOOST_OUTCOME_TRY(check_status(write_batch.Put(
            db_->internal_cf(), root_key_slice, to_slice(tree->key()))));
    }
    else {
        BOOST_OUTCOME_TRY(check_status(
            write_batch.Delete(db_->internal_cf(), root_key_slice)));
    }
    BOOST_OUTCOME_TRY(write_aux(write_batch, db_->aux_cf(), aux));
    return check_status(
        db_->db().Write(rocksdb::WriteOptions{}, &write_batch));
}

Result<void> Merk::flush() const
{
    return check_status(db_->db().Flush(rocksdb::FlushOptions{}, db_->cfs()));
}

Result<Merk> Merk::checkpoint(std::filesystem::path const &path) const
{
    rocksdb::Checkpoint *raw = nullptr;
    BOOST_OUTCOME_TRY(
        check_status(rocksdb::Checkpoint::Create(&db_->db(), &raw)));
    std::unique_ptr<rocksdb::Checkpoint> const checkpoint{raw};
    BOOST_OUTCOME_TRY(check_status(checkpoint->CreateCheckpoint(path.string())));
    LOG_INFO("created checkpoint of {} at {}", path_.string(), path.string());
    return open(path);
}

Result<void> Merk::destroy() &&
{
    auto const path = std::move(path_);
    tree_.reset();
    db_.reset();

    BOOST_OUTCOME_TRY(
        check_status(rocksdb::DestroyDB(path.string(), rocksdb::Options{})));
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        LOG_WARNING("failed to remove {}: {}", path.string(), ec.message());
        return StoreError::IoError;
    }
    return success();
}

Result<std::shared_ptr<Snapshot const>> Merk::snapshot() const
{
    return Snapshot::create(db_);
}

Result<ChunkProducer> Merk::chunks() const
{
    BOOST_OUTCOME_TRY(auto snapshot, this->snapshot());
    return ChunkProducer::create(std::move(snapshot));
}

MERK_NAMESPACE_END
