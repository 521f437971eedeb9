#include <algorithm>
#include <ostream>

#include "color_blend.hpp"

namespace {
  float overlay_channel(const float a, const float b) {
    if (a < 0.5f) {
      return std::min(2.0f * a * b, 1.0f);
    }

    return 1.0f - 2.0f * (1.0f - a) * (1.0f - b);
  }

  float screen_channel(const float a, const float b) {
    return 1.0f - (1.0f - a) * (1.0f - b);
  }

  template <typename F>
  qgen::float_color per_channel(
    const qgen::float_color &a, const qgen::float_color &b, F f
  ) {
    return {
      qgen::un_float::clamped(f(a.r.value(), b.r.value())),
      qgen::un_float::clamped(f(a.g.value(), b.g.value())),
      qgen::un_float::clamped(f(a.b.value(), b.b.value())),
      a.a.average(b.a)
    };
  }
}

qgen::float_color qgen::color_blend_function::blend(
  const float_color &a, const float_color &b, random_engine &rng
) const {
  switch (v) {
    case dissolve: {
      float_color result = random_bool(rng) ? a : b;
      result.a = a.a.average(b.a);
      return result;
    }
    case overlay:
      return per_channel(a, b, overlay_channel);
    case screen_dodge:
      return per_channel(a, b, screen_channel);
  }

  return a;
}

std::string_view qgen::color_blend_function::name() const {
  switch (v) {
    case dissolve: return "Dissolve";
    case overlay: return "Overlay";
    case screen_dodge: return "ScreenDodge";
  }

  return "Unknown";
}

qgen::color_blend_function qgen::color_blend_function::random(
  random_engine &rng
) {
  return values[random_index(rng, values.size())];
}

qgen::color_blend_function qgen::color_blend_function::generate(
  random_engine &rng, const gen_arg
) {
  return random(rng);
}

void qgen::color_blend_function::mutate(random_engine &rng, const mut_arg) {
  *this = random(rng);
}

std::ostream &qgen::operator<<(std::ostream &os, const color_blend_function f) {
  return os << f.name();
}
