#ifndef __MATRICES_HPP__
#define __MATRICES_HPP__
#include <string_view>

#include <glm/glm.hpp>

#include "continuous.hpp"
#include "mutagen.hpp"
#include "normalisers.hpp"
#include "points.hpp"
#include "random.hpp"

namespace qgen {
  // 2d homogeneous transform built from bounded parameters
  class sn_float_matrix3 {
  public:
    static constexpr std::string_view event_key = "sn_float_matrix3";

    sn_float_matrix3() = default;

    static sn_float_matrix3 translation(const sn_float x, const sn_float y);
    static sn_float_matrix3 rotation(const angle theta);
    static sn_float_matrix3 scaling(const sn_float x, const sn_float y);
    static sn_float_matrix3 shear(const sn_float x, const sn_float y);
    static sn_float_matrix3 identity() { return sn_float_matrix3(); }

    const glm::mat3 &value() const { return m; }

    // this * other, so other is applied first
    sn_float_matrix3 multiply(const sn_float_matrix3 &other) const;

    sn_point apply(
      const sn_point &p, const sfloat_normaliser &normaliser,
      random_engine &rng
    ) const;

    static sn_float_matrix3 random(random_engine &rng);
    static sn_float_matrix3 generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    explicit sn_float_matrix3(const glm::mat3 &m) : m(m) {}

    glm::mat3 m{1.0f};
  };
}

#endif // __MATRICES_HPP__
