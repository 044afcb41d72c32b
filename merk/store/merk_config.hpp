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

#include <merk/core/config.hpp>

#include <cstddef>

MERK_NAMESPACE_BEGIN

// RocksDB tuning applied when a store is opened
struct MerkConfig
{
    bool create_if_missing{true};
    // background flush and compaction threads
    int parallelism{2};
    bool optimize_level_style_compaction{true};
    // -1 keeps every file open
    int max_open_files{-1};
    // upper bound on the encoded size of one applied batch, 0 is unbounded
    size_t max_batch_bytes{0};
};

MERK_NAMESPACE_END
