#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtx/matrix_transform_2d.hpp>

#include "matrices.hpp"

qgen::sn_float_matrix3 qgen::sn_float_matrix3::translation(
  const sn_float x, const sn_float y
) {
  return sn_float_matrix3(
    glm::translate(glm::mat3(1.0f), glm::vec2(x.value(), y.value()))
  );
}

qgen::sn_float_matrix3 qgen::sn_float_matrix3::rotation(const angle theta) {
  return sn_float_matrix3(glm::rotate(glm::mat3(1.0f), theta.value()));
}

qgen::sn_float_matrix3 qgen::sn_float_matrix3::scaling(
  const sn_float x, const sn_float y
) {
  return sn_float_matrix3(
    glm::scale(glm::mat3(1.0f), glm::vec2(x.value(), y.value()))
  );
}

// x' = x + sx * y, y' = sy * x + y
qgen::sn_float_matrix3 qgen::sn_float_matrix3::shear(
  const sn_float x, const sn_float y
) {
  glm::mat3 r(1.0f);
  r[1][0] = x.value();
  r[0][1] = y.value();
  return sn_float_matrix3(r);
}

qgen::sn_float_matrix3 qgen::sn_float_matrix3::multiply(
  const sn_float_matrix3 &other
) const {
  return sn_float_matrix3(m * other.m);
}

qgen::sn_point qgen::sn_float_matrix3::apply(
  const sn_point &p, const sfloat_normaliser &normaliser, random_engine &rng
) const {
  const glm::vec3 r = m * glm::vec3(p.value(), 1.0f);
  return sn_point::normalised(glm::vec2(r.x, r.y), normaliser, rng);
}

qgen::sn_float_matrix3 qgen::sn_float_matrix3::random(random_engine &rng) {
  return generate(rng, gen_arg{});
}

qgen::sn_float_matrix3 qgen::sn_float_matrix3::generate(
  random_engine &rng, const gen_arg arg
) {
  const sn_float tx = generate_value<sn_float>(rng, arg);
  const sn_float ty = generate_value<sn_float>(rng, arg);
  const angle theta = generate_value<angle>(rng, arg);
  const sn_float sx = generate_value<sn_float>(rng, arg);
  const sn_float sy = generate_value<sn_float>(rng, arg);

  return translation(tx, ty)
    .multiply(rotation(theta))
    .multiply(scaling(sx, sy));
}

void qgen::sn_float_matrix3::mutate(random_engine &rng, const mut_arg arg) {
  *this = generate(rng, arg);
}
