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

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#include <unistd.h>

namespace
{
    void print_failure(
        char const *expr, char const *function, char const *file,
        long const line, char const *msg)
    {
        char buffer[4096];
        int written = 0;
        if (expr != nullptr) {
            written = snprintf(
                buffer,
                sizeof(buffer),
                "%s:%ld: %s: Assertion '%s' failed.%s%s\n",
                file,
                line,
                function,
                expr,
                msg != nullptr ? " " : "",
                msg != nullptr ? msg : "");
        }
        else {
            written = snprintf(
                buffer,
                sizeof(buffer),
                "%s:%ld: %s: Abort: %s\n",
                file,
                line,
                function,
                msg != nullptr ? msg : "unreachable");
        }
        if (written > 0) {
            size_t const len = static_cast<size_t>(written) < sizeof(buffer)
                                   ? static_cast<size_t>(written)
                                   : sizeof(buffer) - 1;
            if (write(STDERR_FILENO, buffer, len) == -1) {
                // Suppress warning
            }
        }
    }
}

extern "C" void merk_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg)
{
    print_failure(expr, function, file, line, msg);
    abort();
}

extern "C" void merk_assertion_failed_printf(
    char const *expr, char const *function, char const *file, long line,
    char const *format, ...)
{
    char msg[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(msg, sizeof(msg), format, args);
    va_end(args);
    print_failure(expr, function, file, line, msg);
    abort();
}
