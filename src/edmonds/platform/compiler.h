/**
 *    Copyright (C) 2024-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

/**
 * Include "edmonds/platform/compiler.h" to get compiler-targeted macro definitions and
 * utilities.
 *
 * The following macros are provided:
 *
 * EDMONDS_COMPILER_NORETURN
 *
 *   Instructs the compiler that the decorated function will not return through the normal
 *   return path. Correct: EDMONDS_COMPILER_NORETURN void myAbortFunction();
 *
 * EDMONDS_COMPILER_COLD_FUNCTION
 *
 *   Informs the compiler that the function is cold. This can have the following effects:
 *   - The function is optimized for size over speed.
 *   - The function may be placed in a special cold section of the binary, away from other
 *     code.
 *   - Code paths that call this function are considered implicitly unlikely.
 *
 * EDMONDS_COMPILER_UNREACHABLE
 *
 *   Tells the compiler that it can assume that this line will never execute.
 *
 * EDMONDS_unlikely(x)
 *
 *   Branch prediction hint for a boolean condition that is rarely true.
 */

#pragma once

#ifdef __clang__
#define EDMONDS_COMPILER_COLD_FUNCTION
#define EDMONDS_COMPILER_NORETURN __attribute__((__noreturn__))
#else
#define EDMONDS_COMPILER_COLD_FUNCTION __attribute__((__cold__))
#define EDMONDS_COMPILER_NORETURN __attribute__((__noreturn__, __cold__))
#endif

#define EDMONDS_COMPILER_VARIABLE_UNUSED __attribute__((__unused__))

#define EDMONDS_unlikely(x) static_cast<bool>(__builtin_expect(static_cast<bool>(x), 0))

#define EDMONDS_COMPILER_ALWAYS_INLINE [[gnu::always_inline]]

#define EDMONDS_COMPILER_UNREACHABLE __builtin_unreachable()

namespace edmonds {

#if defined(EDMONDS_CONFIG_DEBUG_BUILD)
constexpr bool kDebugBuild = true;
#else
constexpr bool kDebugBuild = false;
#endif

}  // namespace edmonds
