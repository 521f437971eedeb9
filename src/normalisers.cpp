#include <ostream>
#include <string_view>

#include "normalisers.hpp"
#include "util.hpp"

qgen::sn_float qgen::sfloat_normaliser::normalise(
  const float value, random_engine &rng
) const {
  const float x = non_normal_to_default(value);

  switch (v) {
    case sawtooth:
      return sn_float::from_sawtooth(x);
    case triangle:
      return sn_float::from_triangle(x);
    case sin:
      return sn_float::from_sin(x);
    case sin_repeating:
      return sn_float::from_sin_repeating(x);
    case tanh:
      return sn_float::from_tanh(x);
    case clamp:
      return sn_float::clamped(x);
    case fractional:
      return sn_float::from_fractional(x);
    case random_clamped:
      return sn_float::random_clamped(x, rng);
  }

  return sn_float::clamped(x);
}

std::string_view qgen::sfloat_normaliser::name() const {
  switch (v) {
    case sawtooth: return "Sawtooth";
    case triangle: return "Triangle";
    case sin: return "Sin";
    case sin_repeating: return "SinRepeating";
    case tanh: return "Tanh";
    case clamp: return "Clamp";
    case fractional: return "Fractional";
    case random_clamped: return "Random";
  }

  return "Unknown";
}

qgen::sfloat_normaliser qgen::sfloat_normaliser::random(random_engine &rng) {
  return values[random_index(rng, values.size())];
}

qgen::sfloat_normaliser qgen::sfloat_normaliser::generate(
  random_engine &rng, const gen_arg
) {
  return random(rng);
}

void qgen::sfloat_normaliser::mutate(random_engine &rng, const mut_arg) {
  *this = random(rng);
}

qgen::un_float qgen::ufloat_normaliser::normalise(
  const float value, random_engine &rng
) const {
  const float x = non_normal_to_default(value);

  switch (v) {
    case sawtooth:
      return un_float::from_sawtooth(x);
    case triangle:
      return un_float::from_triangle(x);
    case sin:
      return un_float::from_sin(x);
    case sin_repeating:
      return un_float::from_sin_repeating(x);
    case clamp:
      return un_float::clamped(x);
    case random_clamped:
      return un_float::random_clamped(x, rng);
  }

  return un_float::clamped(x);
}

std::string_view qgen::ufloat_normaliser::name() const {
  switch (v) {
    case sawtooth: return "Sawtooth";
    case triangle: return "Triangle";
    case sin: return "Sin";
    case sin_repeating: return "SinRepeating";
    case clamp: return "Clamp";
    case random_clamped: return "Random";
  }

  return "Unknown";
}

qgen::ufloat_normaliser qgen::ufloat_normaliser::random(random_engine &rng) {
  return values[random_index(rng, values.size())];
}

qgen::ufloat_normaliser qgen::ufloat_normaliser::generate(
  random_engine &rng, const gen_arg
) {
  return random(rng);
}

void qgen::ufloat_normaliser::mutate(random_engine &rng, const mut_arg) {
  *this = random(rng);
}

std::ostream &qgen::operator<<(std::ostream &os, const sfloat_normaliser n) {
  return os << n.name();
}

std::ostream &qgen::operator<<(std::ostream &os, const ufloat_normaliser n) {
  return os << n.name();
}
