#include <algorithm>
#include <cmath>
#include <ostream>

#include <glm/glm.hpp>

#include "distance.hpp"

float qgen::distance_function::calculate(
  const glm::vec2 &a, const glm::vec2 &b
) const {
  const glm::vec2 d = glm::abs(b - a);

  switch (v) {
    case euclidean:
      return glm::distance(a, b) * 0.5f;
    case manhattan:
      return (d.x + d.y) * 0.5f;
    case chebyshev:
      return std::max(d.x, d.y);
    case minimum:
      return std::min(d.x, d.y);
  }

  return glm::distance(a, b) * 0.5f;
}

qgen::un_float qgen::distance_function::calculate_normalised(
  const sn_point &a, const sn_point &b,
  const ufloat_normaliser &normaliser, random_engine &rng
) const {
  return normaliser.normalise(calculate(a.value(), b.value()), rng);
}

std::string_view qgen::distance_function::name() const {
  switch (v) {
    case euclidean: return "Euclidean";
    case manhattan: return "Manhattan";
    case chebyshev: return "Chebyshev";
    case minimum: return "Minimum";
  }

  return "Unknown";
}

qgen::distance_function qgen::distance_function::random(random_engine &rng) {
  return values[random_index(rng, values.size())];
}

qgen::distance_function qgen::distance_function::generate(
  random_engine &rng, const gen_arg
) {
  return random(rng);
}

void qgen::distance_function::mutate(random_engine &rng, const mut_arg) {
  *this = random(rng);
}

std::ostream &qgen::operator<<(std::ostream &os, const distance_function d) {
  return os << d.name();
}
