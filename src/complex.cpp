#include <algorithm>
#include <cmath>
#include <complex>
#include <iomanip>
#include <limits>
#include <ostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

#include "complex.hpp"
#include "error.hpp"
#include "normalisers.hpp"
#include "points.hpp"
#include "util.hpp"

namespace {
  bool in_signed_range(const double v) {
    return v >= -1.0 && v <= 1.0;
  }

  const std::regex pair_pattern(
    R"(\s*\(\s*(-?[\d\.]+(?:[eE][-+]?\d+)?)\s*,)"
    R"(\s*(-?[\d\.]+(?:[eE][-+]?\d+)?)\s*\)\s*)"
  );
}

qgen::sn_complex::sn_complex(const std::complex<double> &v) : v(v) {
  ensure(
    in_signed_range(v.real()) && in_signed_range(v.imag()),
    "Invalid sn_complex value: ", v
  );
}

qgen::sn_complex::sn_complex(const double re, const double im)
: sn_complex(std::complex<double>(re, im)) {}

qgen::sn_complex qgen::sn_complex::normalised(
  const std::complex<double> &v, const sfloat_normaliser &normaliser,
  random_engine &rng
) {
  return from_snfloats(
    normaliser.normalise(static_cast<float>(v.real()), rng),
    normaliser.normalise(static_cast<float>(v.imag()), rng)
  );
}

qgen::sn_complex qgen::sn_complex::from_snfloats(
  const sn_float re, const sn_float im
) {
  return sn_complex(re.value(), im.value());
}

qgen::sn_complex qgen::sn_complex::from_snpoint(const sn_point &p) {
  return from_snfloats(p.x(), p.y());
}

qgen::sn_float qgen::sn_complex::re() const {
  return sn_float::clamped(static_cast<float>(v.real()));
}

qgen::sn_float qgen::sn_complex::im() const {
  return sn_float::clamped(static_cast<float>(v.imag()));
}

qgen::sn_point qgen::sn_complex::to_snpoint() const {
  return sn_point::from_snfloats(re(), im());
}

// same orientation as sn_point::to_angle
qgen::angle qgen::sn_complex::to_angle() const {
  const float a = static_cast<float>(std::atan2(v.real(), v.imag()));
  return angle::from_radians(std::clamp(a, -pi, pi));
}

qgen::sn_complex qgen::sn_complex::normalised_add(
  const sn_complex &other, const sfloat_normaliser &normaliser,
  random_engine &rng
) const {
  return normalised(v + other.v, normaliser, rng);
}

qgen::sn_complex qgen::sn_complex::lerp(
  const sn_complex &other, const un_float scalar
) const {
  const std::complex<double> result = qgen::lerp(
    v, other.v, static_cast<double>(scalar.value())
  );

  return sn_complex(
    std::clamp(result.real(), -1.0, 1.0), std::clamp(result.imag(), -1.0, 1.0)
  );
}

std::string qgen::sn_complex::to_string() const {
  std::stringstream ss;
  ss << std::setprecision(std::numeric_limits<double>::max_digits10);
  ss << "(" << v.real() << ", " << v.imag() << ")";
  return ss.str();
}

qgen::sn_complex qgen::sn_complex::parse(const std::string &s) {
  std::smatch match;
  if (!std::regex_match(s, match, pair_pattern)) {
    decode_failure("Invalid sn_complex text: ", s);
  }

  double re = 0.0;
  double im = 0.0;
  try {
    re = std::stod(match[1].str());
    im = std::stod(match[2].str());
  } catch (const std::logic_error &e) {
    decode_failure("Invalid sn_complex component in '", s, "': ", e.what());
  }

  if (!in_signed_range(re) || !in_signed_range(im)) {
    decode_failure("sn_complex out of range: ", s);
  }

  return sn_complex(re, im);
}

qgen::sn_complex qgen::sn_complex::random(random_engine &rng) {
  const double re = random_double(rng, -1.0, 1.0);
  const double im = random_double(rng, -1.0, 1.0);
  return sn_complex(re, im);
}

qgen::sn_complex qgen::sn_complex::generate(
  random_engine &rng, const gen_arg arg
) {
  const sn_float re = generate_value<sn_float>(rng, arg);
  const sn_float im = generate_value<sn_float>(rng, arg);
  return from_snfloats(re, im);
}

void qgen::sn_complex::mutate(random_engine &rng, const mut_arg arg) {
  *this = generate(rng, arg);
}

std::ostream &qgen::operator<<(std::ostream &os, const sn_complex &c) {
  return os << c.to_string();
}
