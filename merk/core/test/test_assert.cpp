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

#include <gtest/gtest.h>

using namespace merk;

TEST(Assert, passes_on_true)
{
    MERK_ASSERT(1 + 1 == 2);
    MERK_ASSERT_PRINTF(true, "value %d", 3);
}

TEST(AssertDeathTest, aborts_on_false)
{
    EXPECT_DEATH(MERK_ASSERT(1 + 1 == 3), "Assertion '1 \\+ 1 == 3' failed");
}

TEST(AssertDeathTest, printf_message)
{
    EXPECT_DEATH(MERK_ASSERT_PRINTF(false, "index %d", 42), "index 42");
}

TEST(AssertDeathTest, abort_message)
{
    EXPECT_DEATH(MERK_ABORT("unreachable state"), "Abort: unreachable state");
}

TEST(ByteString, to_hex)
{
    EXPECT_EQ(to_hex(byte_string_view{}), "");
    byte_string const bytes{0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(to_hex(bytes), "000fa0ff");
}

TEST(ByteString, string_view_conversions)
{
    auto const view = to_byte_string_view("merk");
    ASSERT_EQ(view.size(), 4);
    EXPECT_EQ(view[0], 'm');
    EXPECT_EQ(to_string_view(view), "merk");
}
