#ifndef __CONTINUOUS_HPP__
#define __CONTINUOUS_HPP__
#include <ostream>
#include <string_view>

#include "discrete.hpp"
#include "mutagen.hpp"
#include "random.hpp"

namespace qgen {
  class angle;
  class sn_float;
  class sfloat_normaliser;

  // float in [0, 1]
  class un_float {
  public:
    static constexpr std::string_view event_key = "un_float";

    un_float() = default;
    explicit un_float(const float v);

    // constructors for values that come from outside the type's bounds
    static un_float clamped(const float v);
    static un_float random_clamped(const float v, random_engine &rng);
    static un_float from_range(const float v, const float min, const float max);
    static un_float from_sawtooth(const float v);
    static un_float from_triangle(const float v);
    static un_float from_sin(const float v);
    static un_float from_sin_repeating(const float v);
    static un_float from_raw(const float v);

    static un_float zero() { return un_float(); }
    static un_float one() { return un_float(1.0f); }

    float value() const { return v; }

    un_float average(const un_float other) const;
    un_float multiply(const un_float other) const;
    un_float lerp(const un_float other, const un_float scalar) const;
    un_float sawtooth_add(const un_float other) const;
    un_float sawtooth_add(const float other) const;
    un_float triangle_add(const un_float other) const;
    un_float triangle_add(const float other) const;
    un_float subdivide_sawtooth(const nibble divisor) const;
    un_float subdivide_triangle(const nibble divisor) const;

    angle to_angle() const;
    sn_float to_signed() const;

    static un_float random(random_engine &rng);
    static un_float generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    float v = 0.0f;
  };

  // float in [-1, 1]
  class sn_float {
  public:
    static constexpr std::string_view event_key = "sn_float";

    sn_float() = default;
    explicit sn_float(const float v);

    static sn_float clamped(const float v);
    static sn_float random_clamped(const float v, random_engine &rng);
    static sn_float from_range(const float v, const float min, const float max);
    static sn_float from_sawtooth(const float v);
    static sn_float from_triangle(const float v);
    static sn_float from_sin(const float v);
    static sn_float from_sin_repeating(const float v);
    static sn_float from_tanh(const float v);
    static sn_float from_fractional(const float v);
    static sn_float from_raw(const float v);

    static sn_float zero() { return sn_float(); }
    static sn_float one() { return sn_float(1.0f); }
    static sn_float neg_one() { return sn_float(-1.0f); }

    float value() const { return v; }

    sn_float abs() const;
    sn_float force_sign(const bool positive) const;
    sn_float invert() const;
    sn_float average(const sn_float other) const;
    sn_float multiply(const sn_float other) const;
    sn_float multiply_unfloat(const un_float other) const;
    sn_float lerp(const sn_float other, const un_float scalar) const;
    sn_float subdivide(const nibble divisor) const;

    sn_float normalised_add(
      const sn_float other, const sfloat_normaliser &normaliser,
      random_engine &rng
    ) const;
    sn_float normalised_sub(
      const sn_float other, const sfloat_normaliser &normaliser,
      random_engine &rng
    ) const;

    angle to_angle() const;
    un_float to_unsigned() const;

    static sn_float random(random_engine &rng);
    static sn_float generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    float v = 0.0f;
  };

  // radians in [-pi, pi]
  //
  // the normalising constructor treats its input as a turn measured from -pi,
  // so angle(0) and angle(2 pi) are both -pi and angle(pi) is 0. arithmetic
  // between angles wraps plain radians.
  class angle {
  public:
    static constexpr std::string_view event_key = "angle";

    angle() = default;
    explicit angle(const float v);

    static angle from_radians(const float radians);
    static angle wrapped(const float radians);
    static angle from_range(const float v, const float min, const float max);
    static angle from_raw(const float v);

    static angle zero() { return angle(); }

    float value() const { return v; }

    angle operator+(const angle other) const;
    angle operator-(const angle other) const;
    angle &operator+=(const angle other);
    angle &operator-=(const angle other);

    angle average(const angle other) const;
    // interpolates along the shorter arc
    angle lerp(const angle other, const un_float scalar) const;

    sn_float to_signed() const;
    un_float to_unsigned() const;

    static angle random(random_engine &rng);
    static angle generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    float v = 0.0f;
  };

  inline bool operator==(const un_float a, const un_float b) {
    return a.value() == b.value();
  }
  inline bool operator==(const sn_float a, const sn_float b) {
    return a.value() == b.value();
  }
  inline bool operator==(const angle a, const angle b) {
    return a.value() == b.value();
  }

  std::ostream &operator<<(std::ostream &os, const un_float f);
  std::ostream &operator<<(std::ostream &os, const sn_float f);
  std::ostream &operator<<(std::ostream &os, const angle a);
}

#endif // __CONTINUOUS_HPP__
