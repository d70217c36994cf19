/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef FERRY_PLATFORM_HPP_
#define FERRY_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace ferry {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define FERRY_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define FERRY_PLATFORM_MACOS 1
#endif

// inotify and epoll are required by the watcher and the poller.
#if !defined(FERRY_PLATFORM_LINUX)
#error "ferry requires Linux (inotify, epoll)"
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define FERRY_LIKELY(x) __builtin_expect(!!(x), 1)
#define FERRY_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define FERRY_UNUSED __attribute__((unused))
#else
#define FERRY_LIKELY(x) (x)
#define FERRY_UNLIKELY(x) (x)
#define FERRY_UNUSED
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "FERRY_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define FERRY_ASSERT(cond) ((void)0)
#else
#define FERRY_ASSERT(cond) \
  ((cond) ? ((void)0) : ::ferry::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define FERRY_CONCAT_IMPL(a, b) a##b
#define FERRY_CONCAT(a, b) FERRY_CONCAT_IMPL(a, b)

}  // namespace ferry

#endif  // FERRY_PLATFORM_HPP_
