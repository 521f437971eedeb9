#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>

#include "continuous.hpp"
#include "error.hpp"
#include "normalisers.hpp"
#include "util.hpp"

namespace {
  bool in_unsigned_range(const float v) {
    return v >= 0.0f && v <= 1.0f;
  }

  bool in_signed_range(const float v) {
    return v >= -1.0f && v <= 1.0f;
  }

  // maps any finite float onto [0, 1], repeating every unit
  float sawtooth(const float v) {
    return qgen::fract(v) - std::min(qgen::signum(v), 0.0f);
  }
}

// un_float

qgen::un_float::un_float(const float v) : v(v) {
  ensure(in_unsigned_range(v), "Invalid un_float value: ", v);
}

qgen::un_float qgen::un_float::clamped(const float v) {
  return un_float(std::clamp(v, 0.0f, 1.0f));
}

qgen::un_float qgen::un_float::random_clamped(
  const float v, random_engine &rng
) {
  if (!in_unsigned_range(v)) { return random(rng); }
  return un_float(v);
}

qgen::un_float qgen::un_float::from_range(
  const float v, const float min, const float max
) {
  return clamped(map_range(v, min, max, 0.0f, 1.0f));
}

qgen::un_float qgen::un_float::from_sawtooth(const float v) {
  if (in_unsigned_range(v)) { return un_float(v); }
  return un_float(sawtooth(v));
}

qgen::un_float qgen::un_float::from_triangle(const float v) {
  const float scaled = (v - 1.0f) / 2.0f;
  return un_float(std::abs(sawtooth(scaled) - 0.5f) * 2.0f);
}

// periodic inputs are reduced first so the scaling cannot overflow

qgen::un_float qgen::un_float::from_sin(const float v) {
  const float scaled = (std::fmod(v, 2.0f) - 0.5f) * pi;
  return clamped(std::sin(scaled) / 2.0f + 0.5f);
}

qgen::un_float qgen::un_float::from_sin_repeating(const float v) {
  const float scaled = (std::fmod(v, 1.0f) + 0.5f) * tau;
  return clamped(std::sin(scaled) / 2.0f + 0.5f);
}

qgen::un_float qgen::un_float::from_raw(const float v) {
  if (!in_unsigned_range(v)) {
    decode_failure("un_float out of range: ", v);
  }

  return un_float(v);
}

qgen::un_float qgen::un_float::average(const un_float other) const {
  return un_float((v + other.v) * 0.5f);
}

qgen::un_float qgen::un_float::multiply(const un_float other) const {
  return un_float(v * other.v);
}

qgen::un_float qgen::un_float::lerp(
  const un_float other, const un_float scalar
) const {
  return clamped(qgen::lerp(v, other.v, scalar.v));
}

qgen::un_float qgen::un_float::sawtooth_add(const un_float other) const {
  return sawtooth_add(other.v);
}

qgen::un_float qgen::un_float::sawtooth_add(const float other) const {
  return from_sawtooth(v + other);
}

qgen::un_float qgen::un_float::triangle_add(const un_float other) const {
  return triangle_add(other.v);
}

qgen::un_float qgen::un_float::triangle_add(const float other) const {
  return from_triangle(v + other);
}

qgen::un_float qgen::un_float::subdivide_sawtooth(const nibble divisor) const {
  return from_sawtooth(v * static_cast<float>(divisor.value()));
}

qgen::un_float qgen::un_float::subdivide_triangle(const nibble divisor) const {
  return from_triangle(v * static_cast<float>(divisor.value()));
}

qgen::angle qgen::un_float::to_angle() const {
  return angle::from_range(v, 0.0f, 1.0f);
}

qgen::sn_float qgen::un_float::to_signed() const {
  return sn_float::from_range(v, 0.0f, 1.0f);
}

qgen::un_float qgen::un_float::random(random_engine &rng) {
  return un_float(random_float(rng, 0.0f, 1.0f));
}

qgen::un_float qgen::un_float::generate(random_engine &rng, const gen_arg) {
  return random(rng);
}

void qgen::un_float::mutate(random_engine &rng, const mut_arg) {
  *this = random(rng);
}

// sn_float

qgen::sn_float::sn_float(const float v) : v(v) {
  ensure(in_signed_range(v), "Invalid sn_float value: ", v);
}

qgen::sn_float qgen::sn_float::clamped(const float v) {
  return sn_float(std::clamp(v, -1.0f, 1.0f));
}

qgen::sn_float qgen::sn_float::random_clamped(
  const float v, random_engine &rng
) {
  if (!in_signed_range(v)) { return random(rng); }
  return sn_float(v);
}

qgen::sn_float qgen::sn_float::from_range(
  const float v, const float min, const float max
) {
  return clamped(map_range(v, min, max, -1.0f, 1.0f));
}

qgen::sn_float qgen::sn_float::from_sawtooth(const float v) {
  if (in_signed_range(v)) { return sn_float(v); }

  const float scaled = (v + 1.0f) / 2.0f;
  return sn_float(sawtooth(scaled) * 2.0f - 1.0f);
}

qgen::sn_float qgen::sn_float::from_triangle(const float v) {
  const float scaled = (v - 1.0f) / 4.0f;
  return sn_float(std::abs(sawtooth(scaled) - 0.5f) * 4.0f - 1.0f);
}

qgen::sn_float qgen::sn_float::from_sin(const float v) {
  return clamped(std::sin(v / tau));
}

qgen::sn_float qgen::sn_float::from_sin_repeating(const float v) {
  return clamped(std::sin(std::fmod(v, 2.0f) * pi));
}

qgen::sn_float qgen::sn_float::from_tanh(const float v) {
  return clamped(std::tanh(v));
}

qgen::sn_float qgen::sn_float::from_fractional(const float v) {
  return sn_float(fract(v));
}

qgen::sn_float qgen::sn_float::from_raw(const float v) {
  if (!in_signed_range(v)) {
    decode_failure("sn_float out of range: ", v);
  }

  return sn_float(v);
}

qgen::sn_float qgen::sn_float::abs() const {
  return sn_float(std::abs(v));
}

qgen::sn_float qgen::sn_float::force_sign(const bool positive) const {
  return sn_float(std::abs(v) * (positive ? 1.0f : -1.0f));
}

qgen::sn_float qgen::sn_float::invert() const {
  return sn_float(-v);
}

qgen::sn_float qgen::sn_float::average(const sn_float other) const {
  return sn_float((v + other.v) * 0.5f);
}

qgen::sn_float qgen::sn_float::multiply(const sn_float other) const {
  return sn_float(v * other.v);
}

qgen::sn_float qgen::sn_float::multiply_unfloat(const un_float other) const {
  return sn_float(v * other.value());
}

qgen::sn_float qgen::sn_float::lerp(
  const sn_float other, const un_float scalar
) const {
  return clamped(qgen::lerp(v, other.v, scalar.value()));
}

qgen::sn_float qgen::sn_float::subdivide(const nibble divisor) const {
  const float total = v * static_cast<float>(divisor.value());
  const float magnitude = std::abs(total);

  return sn_float((magnitude - std::floor(magnitude)) * signum(total));
}

qgen::sn_float qgen::sn_float::normalised_add(
  const sn_float other, const sfloat_normaliser &normaliser,
  random_engine &rng
) const {
  return normaliser.normalise(v + other.v, rng);
}

qgen::sn_float qgen::sn_float::normalised_sub(
  const sn_float other, const sfloat_normaliser &normaliser,
  random_engine &rng
) const {
  return normaliser.normalise(v - other.v, rng);
}

qgen::angle qgen::sn_float::to_angle() const {
  return angle::from_range(v, -1.0f, 1.0f);
}

qgen::un_float qgen::sn_float::to_unsigned() const {
  return un_float::from_range(v, -1.0f, 1.0f);
}

qgen::sn_float qgen::sn_float::random(random_engine &rng) {
  return sn_float(random_float(rng, -1.0f, 1.0f));
}

qgen::sn_float qgen::sn_float::generate(random_engine &rng, const gen_arg) {
  return random(rng);
}

void qgen::sn_float::mutate(random_engine &rng, const mut_arg) {
  *this = random(rng);
}

// angle

qgen::angle::angle(const float v) {
  ensure(std::isfinite(v), "Invalid angle value: ", v);

  float normalised = v;
  if (v > 0.0f) {
    normalised = fract(v / tau) * tau;
  } else if (v < 0.0f) {
    normalised = fract(v / tau) * tau + tau;
  }
  normalised -= pi;

  ensure(
    normalised >= -pi && normalised <= pi,
    "Failed to normalise angle: ", v, " -> ", normalised
  );
  this->v = normalised;
}

qgen::angle qgen::angle::from_radians(const float radians) {
  ensure(
    radians >= -pi && radians <= pi, "Invalid angle value: ", radians
  );

  angle a;
  a.v = radians;
  return a;
}

qgen::angle qgen::angle::wrapped(const float radians) {
  return angle(radians + pi);
}

qgen::angle qgen::angle::from_range(
  const float v, const float min, const float max
) {
  return from_radians(std::clamp(map_range(v, min, max, -pi, pi), -pi, pi));
}

qgen::angle qgen::angle::from_raw(const float v) {
  if (!(v >= -pi && v <= pi)) {
    decode_failure("angle out of range: ", v);
  }

  return from_radians(v);
}

qgen::angle qgen::angle::operator+(const angle other) const {
  return wrapped(v + other.v);
}

qgen::angle qgen::angle::operator-(const angle other) const {
  return wrapped(v - other.v);
}

qgen::angle &qgen::angle::operator+=(const angle other) {
  *this = *this + other;
  return *this;
}

qgen::angle &qgen::angle::operator-=(const angle other) {
  *this = *this - other;
  return *this;
}

qgen::angle qgen::angle::average(const angle other) const {
  return from_radians((v + other.v) * 0.5f);
}

qgen::angle qgen::angle::lerp(const angle other, const un_float scalar) const {
  const float s = scalar.value();
  const float diff = other.v - v;

  if (diff > pi) {
    return wrapped(qgen::lerp(v + tau, other.v, s));
  } else if (diff < -pi) {
    return wrapped(qgen::lerp(v, other.v + tau, s));
  }

  return wrapped(qgen::lerp(v, other.v, s));
}

qgen::sn_float qgen::angle::to_signed() const {
  return sn_float::from_range(v, -pi, pi);
}

qgen::un_float qgen::angle::to_unsigned() const {
  return un_float::from_range(v, -pi, pi);
}

qgen::angle qgen::angle::random(random_engine &rng) {
  return from_radians(random_float(rng, -pi, pi));
}

qgen::angle qgen::angle::generate(random_engine &rng, const gen_arg) {
  return random(rng);
}

void qgen::angle::mutate(random_engine &rng, const mut_arg) {
  *this = random(rng);
}

std::ostream &qgen::operator<<(std::ostream &os, const un_float f) {
  return os << f.value();
}

std::ostream &qgen::operator<<(std::ostream &os, const sn_float f) {
  const auto flags = os.flags();
  const auto precision = os.precision();

  os << std::fixed << std::setprecision(4) << f.value();

  os.flags(flags);
  os.precision(precision);
  return os;
}

std::ostream &qgen::operator<<(std::ostream &os, const angle a) {
  return os << a.value();
}
