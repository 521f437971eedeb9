#ifndef __COLOR_BLEND_HPP__
#define __COLOR_BLEND_HPP__
#include <array>
#include <ostream>
#include <string_view>

#include "colors.hpp"
#include "mutagen.hpp"
#include "random.hpp"

namespace qgen {
  class color_blend_function {
  public:
    enum value_t { dissolve, overlay, screen_dodge };

    static constexpr std::string_view event_key = "color_blend_function";
    static constexpr std::array<value_t, 3> values = {
      dissolve, overlay, screen_dodge
    };

    constexpr color_blend_function() = default;
    constexpr color_blend_function(const value_t v) : v(v) {}
    constexpr operator value_t() const { return v; }

    // alpha of the result is always the mean of both alphas
    float_color blend(
      const float_color &a, const float_color &b, random_engine &rng
    ) const;

    std::string_view name() const;

    static color_blend_function random(random_engine &rng);
    static color_blend_function generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    value_t v = dissolve;
  };

  std::ostream &operator<<(std::ostream &os, const color_blend_function f);
}

#endif // __COLOR_BLEND_HPP__
