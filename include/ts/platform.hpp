/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef TS_PLATFORM_HPP_
#define TS_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace ts {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define TS_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define TS_PLATFORM_MACOS 1
#endif

// Socket code relies on SOCK_CLOEXEC and Linux ping sockets.
#if defined(TS_PLATFORM_LINUX)
#define TS_HAS_NETWORK 1
#else
#define TS_HAS_NETWORK 0
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define TS_LIKELY(x) __builtin_expect(!!(x), 1)
#define TS_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define TS_UNUSED __attribute__((unused))
#else
#define TS_LIKELY(x) (x)
#define TS_UNLIKELY(x) (x)
#define TS_UNUSED
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
  (void)std::fprintf(stderr, "TS_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define TS_ASSERT(cond) ((void)0)
#else
#define TS_ASSERT(cond) \
  ((cond) ? ((void)0) : ::ts::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Time Helpers
// ============================================================================

/// @brief Milliseconds per second, used by rate and uptime arithmetic.
static constexpr uint64_t kMsPerSecond = 1000U;

}  // namespace ts

#endif  // TS_PLATFORM_HPP_
