#include <cmath>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "buffers.hpp"
#include "complex.hpp"
#include "continuous.hpp"
#include "distance.hpp"
#include "error.hpp"
#include "matrices.hpp"
#include "normalisers.hpp"
#include "points.hpp"
#include "util.hpp"

#include "test.hpp"

namespace {
  const qgen::sfloat_normaliser clamp_normaliser = qgen::sfloat_normaliser::clamp;

  void test_point_bounds() {
    QGEN_CHECK_THROWS(qgen::sn_point(1.5f, 0.0f), qgen::invariant_error);
    QGEN_CHECK_THROWS(qgen::sn_point(0.0f, -1.01f), qgen::invariant_error);

    qgen::random_engine rng = test_engine();
    for (int i = 0; i < 1000; ++i) {
      const qgen::sn_point p = qgen::sn_point::random(rng);
      const qgen::sn_point q = qgen::sn_point::random(rng);
      const qgen::sn_point r = p.normalised_add(q, clamp_normaliser, rng);

      QGEN_CHECK(std::abs(r.value().x) <= 1.0f && std::abs(r.value().y) <= 1.0f);
      QGEN_CHECK(glm::length(p.subtract_normalised(q).value()) <= 1.0f + 1e-5f);
    }
  }

  void test_point_text() {
    const qgen::sn_point p = qgen::sn_point::parse("(0.25, -0.5)");
    QGEN_CHECK(p == qgen::sn_point(0.25f, -0.5f));
    QGEN_CHECK(qgen::sn_point::parse(" ( -1 ,1 ) ") == qgen::sn_point(-1.0f, 1.0f));

    QGEN_CHECK_THROWS(qgen::sn_point::parse("0.25, -0.5"), qgen::decode_error);
    QGEN_CHECK_THROWS(qgen::sn_point::parse("(1.5, 0)"), qgen::decode_error);
    QGEN_CHECK_THROWS(qgen::sn_point::parse("(abc, 0)"), qgen::decode_error);
    QGEN_CHECK_THROWS(qgen::sn_point::parse("(., 0)"), qgen::decode_error);
    QGEN_CHECK_THROWS(qgen::sn_point::parse("x(0.5, 0.2)y"), qgen::decode_error);
    QGEN_CHECK_THROWS(qgen::sn_point::parse("(0.5, 0.2) (0.1, 0.1)"), qgen::decode_error);

    qgen::random_engine rng = test_engine();
    for (int i = 0; i < 200; ++i) {
      const qgen::sn_point q = qgen::sn_point::random(rng);
      QGEN_CHECK(qgen::sn_point::parse(q.to_string()) == q);
    }
  }

  void test_polar() {
    const qgen::sn_point right = qgen::sn_point::from_polar_components(
      qgen::angle::from_radians(qgen::pi / 2.0f), qgen::un_float(1.0f)
    );
    QGEN_CHECK_NEAR(right.value().x, 1.0, 1e-6);
    QGEN_CHECK_NEAR(right.value().y, 0.0, 1e-6);

    // angles are measured from +y towards +x
    QGEN_CHECK_NEAR(qgen::sn_point(0.0f, 1.0f).to_angle().value(), 0.0, 1e-6);
    QGEN_CHECK_NEAR(
      qgen::sn_point(1.0f, 0.0f).to_angle().value(), qgen::pi / 2.0f, 1e-6
    );

    qgen::random_engine rng = test_engine();
    for (int i = 0; i < 1000; ++i) {
      const qgen::sn_point p = qgen::sn_point::random(rng);
      if (glm::length(p.value()) > 1.0f) { continue; }

      const qgen::sn_point back = p.to_polar().from_polar();
      QGEN_CHECK_NEAR(back.value().x, p.value().x, 1e-5);
      QGEN_CHECK_NEAR(back.value().y, p.value().y, 1e-5);
    }
  }

  void test_subtract_normalised() {
    const qgen::sn_point far = qgen::sn_point(0.5f, 0.0f).subtract_normalised(
      qgen::sn_point::zero()
    );
    QGEN_CHECK_NEAR(far.value().x, 1.0, 1e-6);

    // distances below the floor are divided by the floor instead
    const qgen::sn_point near = qgen::sn_point(0.01f, 0.0f).subtract_normalised(
      qgen::sn_point::zero()
    );
    QGEN_CHECK_NEAR(near.value().x, 0.1, 1e-6);
    QGEN_CHECK(
      qgen::sn_point::zero().subtract_normalised(qgen::sn_point::zero()) ==
      qgen::sn_point::zero()
    );
  }

  void test_complex() {
    const qgen::sn_complex c = qgen::sn_complex::parse("(0.5, -0.25)");
    QGEN_CHECK_NEAR(c.re().value(), 0.5, 1e-6);
    QGEN_CHECK_NEAR(c.im().value(), -0.25, 1e-6);
    QGEN_CHECK(c.to_snpoint() == qgen::sn_point(0.5f, -0.25f));
    QGEN_CHECK_THROWS(qgen::sn_complex::parse("(2, 0)"), qgen::decode_error);
    QGEN_CHECK_THROWS(qgen::sn_complex::parse("z(0.5, 0.2)"), qgen::decode_error);
    QGEN_CHECK_THROWS(qgen::sn_complex(0.0, 1.5), qgen::invariant_error);

    qgen::random_engine rng = test_engine();
    for (int i = 0; i < 200; ++i) {
      const qgen::sn_complex a = qgen::sn_complex::random(rng);
      const qgen::sn_complex b = qgen::sn_complex::random(rng);
      const qgen::sn_complex sum = a.normalised_add(b, clamp_normaliser, rng);

      QGEN_CHECK(std::abs(sum.value().real()) <= 1.0);
      QGEN_CHECK(std::abs(sum.value().imag()) <= 1.0);
    }
  }

  void test_distance_functions() {
    const glm::vec2 a(0.0f, 0.0f);
    const glm::vec2 b(0.6f, 0.8f);

    QGEN_CHECK_NEAR(qgen::distance_function(qgen::distance_function::euclidean).calculate(a, b), 0.5, 1e-6);
    QGEN_CHECK_NEAR(qgen::distance_function(qgen::distance_function::manhattan).calculate(a, b), 0.7, 1e-6);
    QGEN_CHECK_NEAR(qgen::distance_function(qgen::distance_function::chebyshev).calculate(a, b), 0.8, 1e-6);
    QGEN_CHECK_NEAR(qgen::distance_function(qgen::distance_function::minimum).calculate(a, b), 0.6, 1e-6);

    qgen::random_engine rng = test_engine();
    const qgen::ufloat_normaliser clamp = qgen::ufloat_normaliser::clamp;
    for (const auto d : qgen::distance_function::values) {
      const qgen::un_float u = qgen::distance_function(d).calculate_normalised(
        qgen::sn_point(-1.0f, -1.0f), qgen::sn_point(1.0f, 1.0f), clamp, rng
      );
      QGEN_CHECK(u.value() >= 0.0f && u.value() <= 1.0f);
    }
  }

  void test_matrices() {
    qgen::random_engine rng = test_engine();

    const qgen::sn_point moved = qgen::sn_float_matrix3::translation(
      qgen::sn_float(0.25f), qgen::sn_float(-0.25f)
    ).apply(qgen::sn_point(0.5f, 0.5f), clamp_normaliser, rng);
    QGEN_CHECK_NEAR(moved.value().x, 0.75, 1e-6);
    QGEN_CHECK_NEAR(moved.value().y, 0.25, 1e-6);

    const qgen::sn_point turned = qgen::sn_float_matrix3::rotation(
      qgen::angle::from_radians(qgen::pi / 2.0f)
    ).apply(qgen::sn_point(0.5f, 0.0f), clamp_normaliser, rng);
    QGEN_CHECK_NEAR(turned.value().x, 0.0, 1e-6);
    QGEN_CHECK_NEAR(turned.value().y, 0.5, 1e-6);

    // scaling then translating, other is applied first
    const qgen::sn_float_matrix3 both = qgen::sn_float_matrix3::translation(
      qgen::sn_float(0.5f), qgen::sn_float(0.0f)
    ).multiply(qgen::sn_float_matrix3::scaling(
      qgen::sn_float(0.5f), qgen::sn_float(0.5f)
    ));
    const qgen::sn_point p = both.apply(
      qgen::sn_point(1.0f, 1.0f), clamp_normaliser, rng
    );
    QGEN_CHECK_NEAR(p.value().x, 1.0, 1e-6);
    QGEN_CHECK_NEAR(p.value().y, 0.5, 1e-6);

    for (int i = 0; i < 200; ++i) {
      const qgen::sn_float_matrix3 m = qgen::sn_float_matrix3::random(rng);
      const qgen::sn_point q = m.apply(
        qgen::sn_point::random(rng), qgen::sfloat_normaliser::random(rng), rng
      );
      QGEN_CHECK(std::abs(q.value().x) <= 1.0f && std::abs(q.value().y) <= 1.0f);
    }
  }

  void test_buffer_addressing() {
    const qgen::buffer<int> b(100, 100, 0);

    QGEN_CHECK(b.point_to_uint(qgen::sn_point(-1.0f, -1.0f)) == glm::uvec2(0, 0));
    QGEN_CHECK(b.point_to_uint(qgen::sn_point(0.0f, 0.0f)) == glm::uvec2(50, 50));
    QGEN_CHECK(b.point_to_uint(qgen::sn_point(1.0f, 1.0f)) == glm::uvec2(99, 99));

    qgen::buffer<int> w(3, 2, 0);
    w.at(2, 1) = 7;
    QGEN_CHECK(w.get_wrapped(-1, -1) == 7);
    QGEN_CHECK(w.get_wrapped(5, 3) == 7);
    QGEN_CHECK_THROWS(w.at(3, 0), qgen::invariant_error);
  }

  std::vector<int> line_on_4x4(const qgen::sn_point &from, const qgen::sn_point &to) {
    qgen::buffer<int> b(4, 4, 0);
    b.draw_line(from, to, 1);
    return b.data();
  }

  void test_draw_line() {
    const std::vector<int> diagonal = {
      1, 0, 0, 0,
      0, 1, 0, 0,
      0, 0, 1, 0,
      0, 0, 0, 1,
    };
    QGEN_CHECK(
      line_on_4x4(qgen::sn_point(-1.0f, -1.0f), qgen::sn_point(1.0f, 1.0f)) ==
      diagonal
    );

    const std::vector<int> half = {
      1, 0, 0, 0,
      0, 1, 0, 0,
      0, 0, 1, 0,
      0, 0, 0, 0,
    };
    QGEN_CHECK(
      line_on_4x4(qgen::sn_point(-1.0f, -1.0f), qgen::sn_point(0.0f, 0.0f)) ==
      half
    );

    const std::vector<int> row = {
      0, 0, 0, 0,
      0, 0, 0, 0,
      1, 1, 1, 1,
      0, 0, 0, 0,
    };
    QGEN_CHECK(
      line_on_4x4(qgen::sn_point(1.0f, 0.0f), qgen::sn_point(-1.0f, 0.0f)) == row
    );

    qgen::buffer<int> dot(4, 4, 0);
    dot.draw_dot(qgen::sn_point(1.0f, -1.0f), 5);
    QGEN_CHECK(dot.at(3, 0) == 5);
  }

  void test_buffer_text() {
    const qgen::buffer<int> b(12, 7, 3);
    QGEN_CHECK(b.save() == "12 7");

    const qgen::buffer<int> loaded = qgen::buffer<int>::load(b.save());
    QGEN_CHECK(loaded.width() == 12 && loaded.height() == 7);
    QGEN_CHECK(loaded.at(11, 6) == 0);

    QGEN_CHECK_THROWS(qgen::buffer<int>::load("12"), qgen::decode_error);
    QGEN_CHECK_THROWS(qgen::buffer<int>::load("0 4"), qgen::decode_error);
    QGEN_CHECK_THROWS(qgen::buffer<int>::load("4 4 4"), qgen::decode_error);
  }

  void test_buffer_generation() {
    qgen::random_engine rng = test_engine();

    for (int i = 0; i < 5; ++i) {
      const auto b = qgen::buffer<qgen::un_float>::generate(rng, {});
      QGEN_CHECK(b.width() >= 1 && b.width() <= 256);
      QGEN_CHECK(b.height() >= 1 && b.height() <= 256);
      QGEN_CHECK(b.data().size() == b.width() * b.height());
    }
  }
}

int main(int argc, const char *argv[]) {
  configure_from_environment();

  run_if_matches("point_bounds", test_point_bounds);
  run_if_matches("point_text", test_point_text);
  run_if_matches("polar", test_polar);
  run_if_matches("subtract_normalised", test_subtract_normalised);
  run_if_matches("complex", test_complex);
  run_if_matches("distance_functions", test_distance_functions);
  run_if_matches("matrices", test_matrices);
  run_if_matches("buffer_addressing", test_buffer_addressing);
  run_if_matches("draw_line", test_draw_line);
  run_if_matches("buffer_text", test_buffer_text);
  run_if_matches("buffer_generation", test_buffer_generation);

  return finish_tests();
}
