#ifndef __POINTS_HPP__
#define __POINTS_HPP__
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include <glm/glm.hpp>

#include "continuous.hpp"
#include "mutagen.hpp"
#include "random.hpp"

namespace qgen {
  class sfloat_normaliser;
  class sn_complex;

  // point in the square [-1, 1] x [-1, 1]
  class sn_point {
  public:
    static constexpr std::string_view event_key = "sn_point";

    sn_point() = default;
    explicit sn_point(const glm::vec2 &v);
    sn_point(const float x, const float y);

    static sn_point normalised(
      const glm::vec2 &v, const sfloat_normaliser &normaliser,
      random_engine &rng
    );
    static sn_point from_range(
      const glm::vec2 &v, const glm::vec2 &min, const glm::vec2 &max
    );
    static sn_point from_usize_range(
      const glm::uvec2 &v, const glm::uvec2 &min, const glm::uvec2 &max
    );
    static sn_point from_snfloats(const sn_float x, const sn_float y);
    static sn_point from_polar_components(const angle theta, const un_float rho);
    static sn_point from_complex(const sn_complex &c);

    static sn_point zero() { return sn_point(); }

    const glm::vec2 &value() const { return v; }
    sn_float x() const;
    sn_float y() const;

    sn_point abs() const;
    sn_point average(const sn_point other) const;
    sn_point invert_x() const;
    sn_point scale(const sn_float s) const;
    sn_point scale_unfloat(const un_float s) const;
    sn_point scale_point(const sn_point other) const;
    sn_point normalised_add(
      const sn_point other, const sfloat_normaliser &normaliser,
      random_engine &rng
    ) const;
    sn_point normalised_sub(
      const sn_point other, const sfloat_normaliser &normaliser,
      random_engine &rng
    ) const;

    // displacement to other divided by their distance, never by less than
    // min_distance
    sn_point subtract_normalised(const sn_point other) const;
    static constexpr float min_distance = 0.1f;

    // angle measured clockwise from the +y axis
    angle to_angle() const;

    // (x, y) -> (theta / pi, rho * 2 - 1), theta measured from +y. rho is
    // capped at 1 so points outside the unit circle come back on it.
    sn_point to_polar() const;
    sn_point from_polar() const;

    std::string to_string() const;
    static sn_point parse(const std::string &s);

    static sn_point random(random_engine &rng);
    static sn_point generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    glm::vec2 v{0.0f, 0.0f};
  };

  inline bool operator==(const sn_point &a, const sn_point &b) {
    return a.value() == b.value();
  }
  inline bool operator!=(const sn_point &a, const sn_point &b) {
    return !(a == b);
  }

  std::ostream &operator<<(std::ostream &os, const sn_point &p);
}

#endif // __POINTS_HPP__
