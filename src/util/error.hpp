#ifndef __UTIL_ERROR_HPP__
#define __UTIL_ERROR_HPP__
#include <type_traits>

enum class error_code_t {
  ok = 0,
  window_failed,
  data_missing,
  shader_failed,
  bad_seed,
};

template <typename E>
constexpr std::underlying_type_t<E> to_underlying(const E e) noexcept {
  return static_cast<std::underlying_type_t<E>>(e);
}

#endif // __UTIL_ERROR_HPP__
