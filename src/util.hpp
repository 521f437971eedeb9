#ifndef __UTIL_HPP__
#define __UTIL_HPP__
#include <cmath>

namespace qgen {
  constexpr float pi = 3.14159265358979323846f;
  constexpr float tau = 2.0f * pi;

  // linear map from [from_min, from_max] onto [to_min, to_max], throws
  // invariant_error when value is outside the source range
  float map_range(
    const float value,
    const float from_min, const float from_max,
    const float to_min, const float to_max
  );

  template <typename T, typename S>
  T lerp(const T &a, const T &b, const S s) {
    return a + (b - a) * s;
  }

  // fractional part with the sign of the input
  inline float fract(const float value) {
    return value - std::trunc(value);
  }

  // +1 for +0.0 and -1 for -0.0, like a signbit test
  inline float signum(const float value) {
    return std::copysign(1.0f, value);
  }

  // zero, subnormal, infinite and nan inputs collapse to 0
  inline float non_normal_to_default(const float value) {
    return std::isnormal(value) ? value : 0.0f;
  }
}

#endif // __UTIL_HPP__
