#ifndef __DISTANCE_HPP__
#define __DISTANCE_HPP__
#include <array>
#include <ostream>
#include <string_view>

#include <glm/glm.hpp>

#include "continuous.hpp"
#include "mutagen.hpp"
#include "normalisers.hpp"
#include "points.hpp"
#include "random.hpp"

namespace qgen {
  class distance_function {
  public:
    enum value_t { euclidean, manhattan, chebyshev, minimum };

    static constexpr std::string_view event_key = "distance_function";
    static constexpr std::array<value_t, 4> values = {
      euclidean, manhattan, chebyshev, minimum
    };

    constexpr distance_function() = default;
    constexpr distance_function(const value_t v) : v(v) {}
    constexpr operator value_t() const { return v; }

    // euclidean and manhattan are halved so that points in the unit square
    // stay close to [0, 1] apart
    float calculate(const glm::vec2 &a, const glm::vec2 &b) const;
    un_float calculate_normalised(
      const sn_point &a, const sn_point &b,
      const ufloat_normaliser &normaliser, random_engine &rng
    ) const;

    std::string_view name() const;

    static distance_function random(random_engine &rng);
    static distance_function generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    value_t v = euclidean;
  };

  std::ostream &operator<<(std::ostream &os, const distance_function d);
}

#endif // __DISTANCE_HPP__
