/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef DFLOW_PLATFORM_HPP_
#define DFLOW_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <thread>

namespace dflow {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define DFLOW_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define DFLOW_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define DFLOW_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define DFLOW_LIKELY(x) __builtin_expect(!!(x), 1)
#define DFLOW_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define DFLOW_LIKELY(x) (x)
#define DFLOW_UNLIKELY(x) (x)
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
  (void)std::fprintf(stderr, "DFLOW_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

/// Pause hint for spin loops.
inline void CpuRelax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
  __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
  asm volatile("yield" ::: "memory");
#else
  std::this_thread::yield();
#endif
}

}  // namespace detail

#ifdef NDEBUG
#define DFLOW_ASSERT(cond) ((void)0)
#else
#define DFLOW_ASSERT(cond) \
  ((cond) ? ((void)0) : ::dflow::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace dflow

#endif  // DFLOW_PLATFORM_HPP_
