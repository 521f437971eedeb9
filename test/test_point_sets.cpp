#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "error.hpp"
#include "point_sets.hpp"

#include "test.hpp"

namespace {
  using qgen::point_set;
  using qgen::point_set_generator;
  using qgen::sn_point;

  bool contains(const std::vector<sn_point> &points, const sn_point &p) {
    return std::find(points.begin(), points.end(), p) != points.end();
  }

  bool contains_near(const std::vector<sn_point> &points, const sn_point &p) {
    return std::any_of(points.begin(), points.end(), [&p](const sn_point &q) {
      return glm::distance(q.value(), p.value()) < 1e-5f;
    });
  }

  float min_pairwise_distance(const std::vector<sn_point> &points) {
    float result = std::numeric_limits<float>::infinity();
    for (std::size_t i = 0; i < points.size(); ++i) {
      for (std::size_t j = i + 1; j < points.size(); ++j) {
        result = std::min(
          result, glm::distance(points[i].value(), points[j].value())
        );
      }
    }
    return result;
  }

  void test_random_sizes() {
    qgen::random_engine rng = test_engine();

    for (int i = 0; i < 300; ++i) {
      const point_set set = point_set::random(rng);
      QGEN_CHECK(set.size() >= 1);
      QGEN_CHECK(set.size() <= point_set::max_points);

      for (const sn_point &p : set.points()) {
        QGEN_CHECK(std::abs(p.value().x) <= 1.0f && std::abs(p.value().y) <= 1.0f);
      }
    }
  }

  void test_fixed_layouts() {
    qgen::random_engine rng = test_engine();

    QGEN_CHECK(point_set().size() == 1);
    QGEN_CHECK(point_set()[0] == sn_point::zero());

    const point_set moore = point_set_generator(
      point_set_generator::moore{}
    ).generate_point_set(rng);
    QGEN_CHECK(moore.size() == 8);
    QGEN_CHECK(!contains(moore.points(), sn_point::zero()));

    const point_set von_neumann = point_set_generator(
      point_set_generator::von_neumann{}
    ).generate_point_set(rng);
    QGEN_CHECK(von_neumann.size() == 4);
    QGEN_CHECK(contains(von_neumann.points(), sn_point(0.0f, -1.0f)));
  }

  void test_grids() {
    qgen::random_engine rng = test_engine();

    const point_set grid = point_set_generator::parse("UniformGrid 1 1")
      .generate_point_set(rng);
    QGEN_CHECK(grid.size() == 4);
    for (const float x : {-0.5f, 0.5f}) {
      for (const float y : {-0.5f, 0.5f}) {
        QGEN_CHECK(contains(grid.points(), sn_point(x, y)));
      }
    }

    const point_set largest = point_set_generator::parse("UniformGrid 15 15")
      .generate_point_set(rng);
    QGEN_CHECK(largest.size() == 256);

    // 3 x 3 with the even-even cells left out
    const point_set sparse = point_set_generator::parse(
      "SparseGrid 2 2 false false"
    ).generate_point_set(rng);
    QGEN_CHECK(sparse.size() == 5);
    QGEN_CHECK(contains_near(sparse.points(), sn_point(0.0f, 0.0f)));
    QGEN_CHECK(contains_near(sparse.points(), sn_point(0.0f, -2.0f / 3.0f)));
    QGEN_CHECK(!contains_near(sparse.points(), sn_point(-2.0f / 3.0f, -2.0f / 3.0f)));

    const point_set tri = point_set_generator::parse("TriGrid 3 1")
      .generate_point_set(rng);
    QGEN_CHECK(tri.size() == 8);

    for (int x = 0; x < 16; ++x) {
      for (int y = 0; y < 16; ++y) {
        const std::string line =
          "HexGrid " + std::to_string(x) + " " + std::to_string(y);
        const point_set hex = point_set_generator::parse(line)
          .generate_point_set(rng);
        QGEN_CHECK(hex.size() >= 1 && hex.size() <= point_set::max_points);
      }
    }
  }

  void test_rings() {
    qgen::random_engine rng = test_engine();

    // 1 + 1 + 2 + 3 + 5 + 8
    QGEN_CHECK(
      point_set_generator::parse("FibonacciRings 20")
        .generate_point_set(rng).size() == 20
    );
    QGEN_CHECK(
      point_set_generator::parse("FibonacciRings 19")
        .generate_point_set(rng).size() == 12
    );

    // 1 + 4 + 9
    QGEN_CHECK(
      point_set_generator::parse("SquaredRings 14")
        .generate_point_set(rng).size() == 14
    );
    QGEN_CHECK(
      point_set_generator::parse("SquaredRings 0")
        .generate_point_set(rng).size() == 1
    );

    // 1 + 2 + 4 + 6
    QGEN_CHECK(
      point_set_generator::parse("LinearIncreasingRings 13 2")
        .generate_point_set(rng).size() == 13
    );
    QGEN_CHECK(
      point_set_generator::parse("LinearIncreasingRings 200 0")
        .generate_point_set(rng).size() == 1
    );

    for (int i = 0; i < 50; ++i) {
      const point_set rings = point_set_generator::parse("RandomRings 15")
        .generate_point_set(rng);
      QGEN_CHECK(rings.size() >= 16 && rings.size() <= 256);
    }
  }

  void test_poisson_spacing() {
    qgen::random_engine rng = test_engine();

    for (int i = 0; i < 40; ++i) {
      const auto count = qgen::byte::random(rng);
      const auto radius = qgen::un_float::random(rng);
      const point_set_generator g(point_set_generator::poisson{count, radius});
      const point_set set = g.generate_point_set(rng);

      const float requested = static_cast<float>(count.value());
      const float spacing = std::max(
        2.0f * radius.value() / std::max(std::sqrt(requested), 2.0f), 0.01f
      );

      QGEN_CHECK(set.size() >= 1);
      QGEN_CHECK(set.size() <= std::max<std::size_t>(count.value(), 4));
      QGEN_CHECK(min_pairwise_distance(set.points()) > spacing);
    }
  }

  void test_spiral() {
    qgen::random_engine rng = test_engine();

    const point_set spiral = point_set_generator::parse(
      "Spiral 50 0.5 3.14159 true 0.5"
    ).generate_point_set(rng);
    QGEN_CHECK(spiral.size() == 50);
    QGEN_CHECK(spiral[0] == sn_point::zero());

    QGEN_CHECK(
      point_set_generator::parse("Spiral 0 0.5 1 false 0.25")
        .generate_point_set(rng).size() == 1
    );
  }

  void test_text_round_trip() {
    qgen::random_engine rng = test_engine();

    for (int i = 0; i < 200; ++i) {
      const point_set_generator g = point_set_generator::random(rng);
      QGEN_CHECK(point_set_generator::parse(g.to_string()).to_string() == g.to_string());
    }

    const point_set grid = point_set_generator::parse("HexGrid 4 5")
      .generate_point_set(rng);
    QGEN_CHECK(grid.save() == "HexGrid 4 5");
    QGEN_CHECK(point_set::load(grid.save()).points() == grid.points());

    const point_set rings = point_set_generator::parse("SquaredRings 30")
      .generate_point_set(rng);
    QGEN_CHECK(point_set::load(rings.save()).points() == rings.points());
  }

  void test_parse_errors() {
    QGEN_CHECK_THROWS(point_set_generator::parse(""), qgen::decode_error);
    QGEN_CHECK_THROWS(point_set_generator::parse("Triangle 1 1"), qgen::decode_error);
    QGEN_CHECK_THROWS(point_set_generator::parse("UniformGrid 1"), qgen::decode_error);
    QGEN_CHECK_THROWS(point_set_generator::parse("UniformGrid 16 1"), qgen::decode_error);
    QGEN_CHECK_THROWS(point_set_generator::parse("UniformGrid 1 1 1"), qgen::decode_error);
    QGEN_CHECK_THROWS(point_set_generator::parse("Poisson 300 0.5"), qgen::decode_error);
    QGEN_CHECK_THROWS(point_set_generator::parse("Poisson 30 1.5"), qgen::decode_error);
    QGEN_CHECK_THROWS(
      point_set_generator::parse("SparseGrid 1 1 maybe true"), qgen::decode_error
    );
  }

  void test_storage() {
    QGEN_CHECK_THROWS(
      point_set(
        std::make_shared<const std::vector<sn_point>>(),
        point_set_generator::origin{}
      ),
      qgen::invariant_error
    );
    QGEN_CHECK_THROWS(
      point_set(
        std::make_shared<const std::vector<sn_point>>(257, sn_point::zero()),
        point_set_generator::origin{}
      ),
      qgen::invariant_error
    );

    point_set a;
    const point_set b = a;
    a.replace(std::make_shared<const std::vector<sn_point>>(
      std::vector<sn_point>{sn_point(0.5f, 0.5f), sn_point(-0.5f, 0.5f)}
    ));
    QGEN_CHECK(a.size() == 2);
    QGEN_CHECK(b.size() == 1);
    QGEN_CHECK_THROWS(a[2], qgen::invariant_error);
  }

  void test_queries() {
    const point_set set(
      std::make_shared<const std::vector<sn_point>>(std::vector<sn_point>{
        sn_point(0.0f, 0.0f), sn_point(0.5f, 0.0f),
        sn_point(-0.25f, 0.0f), sn_point(1.0f, 1.0f)
      }),
      point_set_generator::origin{}
    );

    QGEN_CHECK(set.get_closest_point(sn_point(0.0f, 0.0f)) == sn_point(-0.25f, 0.0f));
    QGEN_CHECK(set.get_closest_point(sn_point(0.4f, 0.0f)) == sn_point(0.5f, 0.0f));
    QGEN_CHECK(set.get_furthest_point(sn_point(0.0f, 0.0f)) == sn_point(1.0f, 1.0f));

    const std::vector<sn_point> closest = set.get_n_closest_points(sn_point(0.5f, 0.0f), 3);
    QGEN_CHECK(closest.size() == 3);
    QGEN_CHECK(closest[0] == sn_point(0.5f, 0.0f));
    QGEN_CHECK(closest[1] == sn_point(0.0f, 0.0f));
    QGEN_CHECK(closest[2] == sn_point(-0.25f, 0.0f));
    QGEN_CHECK(set.get_n_closest_points(sn_point::zero(), 10).size() == 4);

    const point_set single;
    QGEN_CHECK(single.get_closest_point(sn_point::zero()) == sn_point::zero());
    QGEN_CHECK(single.get_furthest_point(sn_point(0.5f, 0.5f)) == sn_point::zero());

    const std::vector<sn_point> offsets = set.get_offsets(100, 50);
    QGEN_CHECK_NEAR(offsets[3].value().x, 0.01, 1e-6);
    QGEN_CHECK_NEAR(offsets[3].value().y, 0.02, 1e-6);

    qgen::random_engine rng = test_engine();
    for (int i = 0; i < 50; ++i) {
      QGEN_CHECK(contains(set.points(), set.get_random_point(rng)));
    }
  }
}

int main(int argc, const char *argv[]) {
  configure_from_environment();

  run_if_matches("random_sizes", test_random_sizes);
  run_if_matches("fixed_layouts", test_fixed_layouts);
  run_if_matches("grids", test_grids);
  run_if_matches("rings", test_rings);
  run_if_matches("poisson_spacing", test_poisson_spacing);
  run_if_matches("spiral", test_spiral);
  run_if_matches("text_round_trip", test_text_round_trip);
  run_if_matches("parse_errors", test_parse_errors);
  run_if_matches("storage", test_storage);
  run_if_matches("queries", test_queries);

  return finish_tests();
}
