#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <ostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

#include <glm/glm.hpp>

#include "complex.hpp"
#include "error.hpp"
#include "normalisers.hpp"
#include "points.hpp"
#include "util.hpp"

namespace {
  bool in_signed_range(const float v) {
    return v >= -1.0f && v <= 1.0f;
  }

  const std::regex pair_pattern(
    R"(\s*\(\s*(-?[\d\.]+(?:[eE][-+]?\d+)?)\s*,)"
    R"(\s*(-?[\d\.]+(?:[eE][-+]?\d+)?)\s*\)\s*)"
  );
}

qgen::sn_point::sn_point(const glm::vec2 &v) : v(v) {
  ensure(
    in_signed_range(v.x) && in_signed_range(v.y),
    "Invalid sn_point value: (", v.x, ", ", v.y, ")"
  );
}

qgen::sn_point::sn_point(const float x, const float y)
: sn_point(glm::vec2(x, y)) {}

qgen::sn_point qgen::sn_point::normalised(
  const glm::vec2 &v, const sfloat_normaliser &normaliser, random_engine &rng
) {
  return from_snfloats(normaliser.normalise(v.x, rng), normaliser.normalise(v.y, rng));
}

qgen::sn_point qgen::sn_point::from_range(
  const glm::vec2 &v, const glm::vec2 &min, const glm::vec2 &max
) {
  return from_snfloats(
    sn_float::from_range(v.x, min.x, max.x),
    sn_float::from_range(v.y, min.y, max.y)
  );
}

qgen::sn_point qgen::sn_point::from_usize_range(
  const glm::uvec2 &v, const glm::uvec2 &min, const glm::uvec2 &max
) {
  return from_range(glm::vec2(v), glm::vec2(min), glm::vec2(max));
}

qgen::sn_point qgen::sn_point::from_snfloats(const sn_float x, const sn_float y) {
  sn_point p;
  p.v = glm::vec2(x.value(), y.value());
  return p;
}

qgen::sn_point qgen::sn_point::from_polar_components(
  const angle theta, const un_float rho
) {
  const float t = theta.value();
  const float r = rho.value();

  return from_snfloats(
    sn_float::clamped(r * std::sin(t)), sn_float::clamped(r * std::cos(t))
  );
}

qgen::sn_point qgen::sn_point::from_complex(const sn_complex &c) {
  return from_snfloats(c.re(), c.im());
}

qgen::sn_float qgen::sn_point::x() const {
  return sn_float(v.x);
}

qgen::sn_float qgen::sn_point::y() const {
  return sn_float(v.y);
}

qgen::sn_point qgen::sn_point::abs() const {
  return from_snfloats(x().abs(), y().abs());
}

qgen::sn_point qgen::sn_point::average(const sn_point other) const {
  return sn_point((v + other.v) * 0.5f);
}

qgen::sn_point qgen::sn_point::invert_x() const {
  return from_snfloats(x().invert(), y());
}

qgen::sn_point qgen::sn_point::scale(const sn_float s) const {
  return from_snfloats(x().multiply(s), y().multiply(s));
}

qgen::sn_point qgen::sn_point::scale_unfloat(const un_float s) const {
  return from_snfloats(x().multiply_unfloat(s), y().multiply_unfloat(s));
}

qgen::sn_point qgen::sn_point::scale_point(const sn_point other) const {
  return from_snfloats(x().multiply(other.x()), y().multiply(other.y()));
}

qgen::sn_point qgen::sn_point::normalised_add(
  const sn_point other, const sfloat_normaliser &normaliser, random_engine &rng
) const {
  return from_snfloats(
    x().normalised_add(other.x(), normaliser, rng),
    y().normalised_add(other.y(), normaliser, rng)
  );
}

qgen::sn_point qgen::sn_point::normalised_sub(
  const sn_point other, const sfloat_normaliser &normaliser, random_engine &rng
) const {
  return from_snfloats(
    x().normalised_sub(other.x(), normaliser, rng),
    y().normalised_sub(other.y(), normaliser, rng)
  );
}

qgen::sn_point qgen::sn_point::subtract_normalised(const sn_point other) const {
  const glm::vec2 delta = v - other.v;
  const float d = std::max(glm::distance(v, other.v), min_distance);

  // |delta| / d is at most 1 for d >= |delta|, the clamp only absorbs rounding
  return from_snfloats(
    sn_float::clamped(delta.x / d), sn_float::clamped(delta.y / d)
  );
}

qgen::angle qgen::sn_point::to_angle() const {
  return angle::from_radians(std::clamp(std::atan2(v.x, v.y), -pi, pi));
}

qgen::sn_point qgen::sn_point::to_polar() const {
  const angle theta = to_angle();
  const un_float rho = un_float::clamped(glm::length(v));

  return from_snfloats(theta.to_signed(), rho.to_signed());
}

qgen::sn_point qgen::sn_point::from_polar() const {
  return from_polar_components(x().to_angle(), y().to_unsigned());
}

std::string qgen::sn_point::to_string() const {
  std::stringstream ss;
  ss << std::setprecision(std::numeric_limits<float>::max_digits10);
  ss << "(" << v.x << ", " << v.y << ")";
  return ss.str();
}

qgen::sn_point qgen::sn_point::parse(const std::string &s) {
  std::smatch match;
  if (!std::regex_match(s, match, pair_pattern)) {
    decode_failure("Invalid sn_point text: ", s);
  }

  float x = 0.0f;
  float y = 0.0f;
  try {
    x = std::stof(match[1].str());
    y = std::stof(match[2].str());
  } catch (const std::logic_error &e) {
    decode_failure("Invalid sn_point component in '", s, "': ", e.what());
  }

  if (!in_signed_range(x) || !in_signed_range(y)) {
    decode_failure("sn_point out of range: ", s);
  }

  return sn_point(x, y);
}

qgen::sn_point qgen::sn_point::random(random_engine &rng) {
  const float x = random_float(rng, -1.0f, 1.0f);
  const float y = random_float(rng, -1.0f, 1.0f);
  return sn_point(x, y);
}

qgen::sn_point qgen::sn_point::generate(random_engine &rng, const gen_arg arg) {
  const sn_float x = generate_value<sn_float>(rng, arg);
  const sn_float y = generate_value<sn_float>(rng, arg);
  return from_snfloats(x, y);
}

void qgen::sn_point::mutate(random_engine &rng, const mut_arg arg) {
  *this = generate(rng, arg);
}

std::ostream &qgen::operator<<(std::ostream &os, const sn_point &p) {
  return os << p.to_string();
}
