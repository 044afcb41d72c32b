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

#include <merk/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

__attribute__((noreturn)) void merk_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

__attribute__((noreturn, format(printf, 5, 6))) void
merk_assertion_failed_printf(
    char const *expr, char const *function, char const *file, long line,
    char const *format, ...);

#ifdef __cplusplus
}
#endif

#define MERK_ASSERT(expr)                                                      \
    (MERK_LIKELY(!!(expr))                                                     \
         ? (void)0                                                             \
         : merk_assertion_failed(                                              \
               #expr, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__,   \
               0))

#define MERK_ASSERT_PRINTF(expr, format, ...)                                  \
    (MERK_LIKELY(!!(expr))                                                     \
         ? (void)0                                                             \
         : merk_assertion_failed_printf(                                       \
               #expr,                                                          \
               __extension__ __PRETTY_FUNCTION__,                              \
               __FILE__,                                                       \
               __LINE__,                                                       \
               format,                                                         \
               ##__VA_ARGS__))

#define MERK_ABORT(msg)                                                        \
    merk_assertion_failed(                                                     \
        0, __extension__ __PRETTY_FUNCTION__, __FILE__, __LINE__, (msg))

#ifdef NDEBUG
    #define MERK_DEBUG_ASSERT(expr) ((void)0)
#else
    #define MERK_DEBUG_ASSERT(expr) MERK_ASSERT(expr)
#endif
