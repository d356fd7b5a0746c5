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

#include <omni/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void omni_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

#define OMNI_ASSERT_MSG_(msg, ...) msg

#define OMNI_ASSERT(expr, ...)                                                 \
    if (OMNI_LIKELY(expr)) { /* likeliest */                                   \
    }                                                                          \
    else {                                                                     \
        omni_assertion_failed(                                                 \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__,                                                          \
            OMNI_ASSERT_MSG_(__VA_ARGS__ __VA_OPT__(, ) nullptr));             \
    }

#ifdef __cplusplus
}
#endif
