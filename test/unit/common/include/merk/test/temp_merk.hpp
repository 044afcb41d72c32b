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

#include <merk/core/assert.h>
#include <merk/core/byte_string.hpp>
#include <merk/store/db.hpp>
#include <merk/store/merk.hpp>
#include <merk/store/merk_config.hpp>
#include <merk/store/rocksdb_util.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace merk::test
{
    inline std::filesystem::path make_temp_path()
    {
        static std::atomic<unsigned> counter{0};
        return std::filesystem::temp_directory_path() /
               ("merk_test_" + std::to_string(getpid()) + "_" +
                std::to_string(counter.fetch_add(1)));
    }

    // Replaces the stored encoding of a tree node of a closed store
    inline void overwrite_node(
        std::filesystem::path const &path, byte_string_view const key,
        byte_string_view const encoded)
    {
        auto db = detail::Db::open(path, MerkConfig{.create_if_missing = false});
        MERK_ASSERT(db.has_value());
        auto const s = db.value()->db().Put(
            rocksdb::WriteOptions{},
            db.value()->tree_cf(),
            to_slice(key),
            to_slice(encoded));
        MERK_ASSERT(s.ok());
    }

    // Store in a fresh temporary directory, deleted on destruction
    class TempMerk
    {
        std::filesystem::path path_;
        std::optional<Merk> merk_;

    public:
        TempMerk()
            : path_{make_temp_path()}
        {
            std::filesystem::remove_all(path_);
            reopen();
        }

        TempMerk(TempMerk const &) = delete;
        TempMerk &operator=(TempMerk const &) = delete;

        ~TempMerk()
        {
            if (merk_.has_value()) {
                auto const res = std::move(*merk_).destroy();
                EXPECT_TRUE(res.has_value());
                merk_.reset();
            }
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        std::filesystem::path const &path() const
        {
            return path_;
        }

        void close()
        {
            merk_.reset();
        }

        // Closes and opens the store again from disk
        void reopen(MerkConfig const &config = {})
        {
            merk_.reset();
            auto res = Merk::open(path_, config);
            MERK_ASSERT(res.has_value());
            merk_.emplace(std::move(res).value());
        }

        Merk &operator*()
        {
            return *merk_;
        }

        Merk *operator->()
        {
            return &*merk_;
        }
    };
}
