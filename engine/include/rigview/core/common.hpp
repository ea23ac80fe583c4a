#pragma once

/**
 * @file common.hpp
 * @brief Invariant checks and small helpers shared across rigview
 */

#include <cstddef>
#include <string>
#include <cpptrace/cpptrace.hpp>

#include "logger.hpp"

// Checked in Debug builds only. A failed check logs with a stack trace and
// throws, so doctest reports it as a test failure instead of aborting.
#ifdef DEBUG
#define RIGVIEW_ASSERT(condition, message)                                     \
  do {                                                                         \
    if (!(condition)) {                                                        \
      rigview::core::Logger::fatal("Invariant violated: {} ({}:{})", message, \
                                   __FILE__, __LINE__);                        \
      throw cpptrace::logic_error(std::string("Invariant violated: ") +       \
                                  message);                                    \
    }                                                                          \
  } while (0)
#else
#define RIGVIEW_ASSERT(condition, message) (void)(0)
#endif

namespace rigview::util {

template <typename T>
constexpr size_t sz(T value) noexcept {
  return static_cast<size_t>(value);
}

} // namespace rigview::util
