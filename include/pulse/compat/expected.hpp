/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * Setup-time APIs (link/queue factories, graph construction, config loading)
 * report failures through these aliases; hot paths never do.
 *
 * - In C++23 and later: uses <expected> from the standard library.
 * - In C++20: falls back to <tl/expected.hpp>, the header-only backport by
 *   TartanLlama (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace pulse_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace pulse_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
