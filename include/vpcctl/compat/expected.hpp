/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected.
 *
 * Provides a unified alias for expected/unexpected so the rest of vpcctl
 * does not depend directly on a specific implementation.
 *
 * - When <expected> ships the final C++23 version: std::expected.
 * - Otherwise: <tl/expected.hpp>, the header-only backport by TartanLlama
 *   (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace vpcctl_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace vpcctl_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
