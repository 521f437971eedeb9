#ifndef __NORMALISERS_HPP__
#define __NORMALISERS_HPP__
#include <array>
#include <ostream>
#include <string_view>

#include "continuous.hpp"
#include "mutagen.hpp"
#include "random.hpp"

namespace qgen {
  // policy for folding an arbitrary float back into [-1, 1]
  class sfloat_normaliser {
  public:
    enum value_t {
      sawtooth,
      triangle,
      sin,
      sin_repeating,
      tanh,
      clamp,
      fractional,
      random_clamped
    };

    static constexpr std::string_view event_key = "sfloat_normaliser";
    static constexpr std::array<value_t, 8> values = {
      sawtooth, triangle, sin, sin_repeating,
      tanh, clamp, fractional, random_clamped
    };

    constexpr sfloat_normaliser() = default;
    constexpr sfloat_normaliser(const value_t v) : v(v) {}
    constexpr operator value_t() const { return v; }

    // non-finite and subnormal input is treated as 0
    sn_float normalise(const float value, random_engine &rng) const;

    std::string_view name() const;

    static sfloat_normaliser random(random_engine &rng);
    static sfloat_normaliser generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    value_t v = sawtooth;
  };

  // policy for folding an arbitrary float back into [0, 1]
  class ufloat_normaliser {
  public:
    enum value_t {
      sawtooth,
      triangle,
      sin,
      sin_repeating,
      clamp,
      random_clamped
    };

    static constexpr std::string_view event_key = "ufloat_normaliser";
    static constexpr std::array<value_t, 6> values = {
      sawtooth, triangle, sin, sin_repeating, clamp, random_clamped
    };

    constexpr ufloat_normaliser() = default;
    constexpr ufloat_normaliser(const value_t v) : v(v) {}
    constexpr operator value_t() const { return v; }

    un_float normalise(const float value, random_engine &rng) const;

    std::string_view name() const;

    static ufloat_normaliser random(random_engine &rng);
    static ufloat_normaliser generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    value_t v = sawtooth;
  };

  std::ostream &operator<<(std::ostream &os, const sfloat_normaliser n);
  std::ostream &operator<<(std::ostream &os, const ufloat_normaliser n);
}

#endif // __NORMALISERS_HPP__
