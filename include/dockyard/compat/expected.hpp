/**
 * @file expected.hpp
 * @brief Compatibility alias for std::expected (C++23) and tl::expected (C++20).
 *
 * The rest of the codebase spells fallible results as
 * dockyard_detail::expected<T, E> and never names an implementation directly.
 *
 * - In C++23 and later: uses <expected> from the standard library.
 * - In C++20: uses <tl/expected.hpp> (TartanLlama's header-only backport).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace dockyard_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace dockyard_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
