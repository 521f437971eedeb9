#ifndef __POINT_SETS_HPP__
#define __POINT_SETS_HPP__
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "continuous.hpp"
#include "discrete.hpp"
#include "mutagen.hpp"
#include "normalisers.hpp"
#include "points.hpp"
#include "random.hpp"

namespace qgen {
  class point_set;

  // descriptor for a layout algorithm, the points themselves are produced by
  // generate_point_set
  class point_set_generator {
  public:
    struct origin {};
    struct moore {};
    struct von_neumann {};
    struct uniform_grid {
      nibble x_count;
      nibble y_count;
    };
    struct sparse_grid {
      nibble x_count;
      nibble y_count;
      boolean x_mod;
      boolean y_mod;
    };
    struct hex_grid {
      nibble x_count;
      nibble y_count;
    };
    struct tri_grid {
      nibble x_count;
      nibble y_count;
    };
    struct uniform_distribution {
      byte count;
    };
    struct poisson {
      byte count;
      un_float radius;
    };
    struct spiral {
      byte count;
      un_float scalar;
      angle maximum;
      boolean linear;
      // doubled to give the exponent, so both squaring and square roots
      // are reachable
      un_float nonlinearity_factor_halved;
    };
    struct random_rings {
      nibble max_rings;
    };
    struct linear_increasing_rings {
      byte max_count;
      nibble ring_size_delta;
    };
    struct fibonacci_rings {
      byte max_count;
    };
    struct squared_rings {
      byte max_count;
    };

    using variant_t = std::variant<
      origin, moore, von_neumann,
      uniform_grid, sparse_grid, hex_grid, tri_grid,
      uniform_distribution, poisson, spiral,
      random_rings, linear_increasing_rings, fibonacci_rings, squared_rings
    >;

    static constexpr std::string_view event_key = "point_set_generator";
    // candidates tried around an active point before it is retired
    static constexpr int poisson_attempts = 30;

    point_set_generator() = default;

    template <
      typename T,
      typename = std::enable_if_t<std::is_constructible_v<variant_t, T>>
    >
    point_set_generator(const T &g) : g(g) {}

    const variant_t &value() const { return g; }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(g); }

    // never empty, never more than point_set::max_points
    point_set generate_point_set(random_engine &rng) const;

    std::string to_string() const;
    static point_set_generator parse(const std::string &s);

    // any variant but origin
    static point_set_generator random(random_engine &rng);
    static point_set_generator generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    variant_t g;
  };

  // 1 to 256 points sharing immutable storage between copies
  class point_set {
  public:
    using storage = std::shared_ptr<const std::vector<sn_point>>;

    static constexpr std::string_view event_key = "point_set";
    static constexpr std::size_t max_points = 256;

    point_set();
    point_set(storage points, const point_set_generator &generator);

    const std::vector<sn_point> &points() const { return *pts; }
    std::size_t size() const { return pts->size(); }
    const point_set_generator &generator() const { return gen; }

    const sn_point &operator[](const std::size_t index) const;
    const sn_point &operator[](const byte index) const;

    // every point scaled down to the size of one pixel of a w x h grid
    std::vector<sn_point> get_offsets(
      const std::size_t width, const std::size_t height
    ) const;

    // installs a new buffer, copies made earlier keep the old one
    void replace(storage points);

    // both skip points equal to other and fall back to other itself
    sn_point get_closest_point(const sn_point &other) const;
    sn_point get_furthest_point(const sn_point &other) const;
    // ascending distance, exact matches first
    std::vector<sn_point> get_n_closest_points(
      const sn_point &other, const std::size_t n
    ) const;
    sn_point get_random_point(random_engine &rng) const;

    // the generator line only, load() regenerates the points from it
    std::string save() const;
    static point_set load(const std::string &text);

    static point_set random(random_engine &rng);
    static point_set generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    storage pts;
    point_set_generator gen;
  };

  std::ostream &operator<<(std::ostream &os, const point_set_generator &g);
}

#endif // __POINT_SETS_HPP__
