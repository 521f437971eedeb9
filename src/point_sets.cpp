#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <iomanip>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "error.hpp"
#include "point_sets.hpp"
#include "util.hpp"

namespace {
  using qgen::sn_point;
  using generator = qgen::point_set_generator;

  std::vector<sn_point> origin_points() {
    return {sn_point::zero()};
  }

  std::vector<sn_point> moore_points() {
    return {
      {-1.0f, -1.0f}, {-1.0f, 0.0f}, {-1.0f, 1.0f},
      {0.0f, -1.0f}, {0.0f, 1.0f},
      {1.0f, -1.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}
    };
  }

  std::vector<sn_point> von_neumann_points() {
    return {{1.0f, 0.0f}, {-1.0f, 0.0f}, {0.0f, 1.0f}, {0.0f, -1.0f}};
  }

  // centre of cell i when [-1, 1] is cut into cells of width 2 * ratio
  float cell_centre(const unsigned int i, const float ratio, const float offset) {
    return 2.0f * (ratio * static_cast<float>(i) + ratio * offset) - 1.0f;
  }

  // ring index / ring count is the radius, points spaced evenly from -pi
  std::vector<sn_point> ring_points(const std::vector<unsigned int> &sizes) {
    std::vector<sn_point> points;
    const float ring_count = static_cast<float>(sizes.size());

    for (std::size_t index = 0; index < sizes.size(); ++index) {
      const unsigned int size = sizes[index];
      const qgen::un_float rho(static_cast<float>(index) / ring_count);

      for (unsigned int j = 0; j < size; ++j) {
        const float theta = static_cast<float>(j) * (qgen::tau / size) - qgen::pi;
        points.push_back(sn_point::from_polar_components(
          qgen::angle::from_radians(std::clamp(theta, -qgen::pi, qgen::pi)), rho
        ));
      }
    }

    return points;
  }

  // sizes from next(0), next(1), ... while their running total fits in
  // max_count, the first ring is always kept and a size of 0 ends the run
  std::vector<unsigned int> ring_sizes(
    const unsigned int max_count,
    const std::function<unsigned int(unsigned int)> &next
  ) {
    std::vector<unsigned int> sizes;
    unsigned int total = 0;

    for (unsigned int k = 0; ; ++k) {
      const unsigned int size = next(k);
      if (size == 0) { break; }
      if (total + size > max_count && !sizes.empty()) { break; }

      sizes.push_back(size);
      total += size;
    }

    return sizes;
  }

  unsigned int fibonacci(const unsigned int k) {
    unsigned int a = 1;
    unsigned int b = 1;
    for (unsigned int i = 0; i < k; ++i) {
      const unsigned int next = a + b;
      a = b;
      b = next;
    }
    return a;
  }

  std::vector<sn_point> poisson_disk(
    qgen::random_engine &rng, const std::size_t count, const float radius,
    const qgen::sfloat_normaliser normaliser
  ) {
    qgen::ensure(radius > 0.0f, "Invalid poisson radius: ", radius);
    qgen::ensure(count > 0, "Invalid poisson count: ", count);

    // a cell's diagonal is radius so a cell holds at most one point
    const float cell = radius / std::sqrt(2.0f);
    const int grid_size = static_cast<int>(std::ceil(1.0f / cell)) * 2;

    const auto to_cell = [&](const sn_point &p) {
      const auto axis = [&](const float v) {
        const int c = static_cast<int>(std::floor((v + 1.0f) / cell));
        return std::clamp(c, 0, grid_size - 1);
      };
      return glm::ivec2(axis(p.value().x), axis(p.value().y));
    };

    std::vector<int> grid(static_cast<std::size_t>(grid_size * grid_size), -1);
    std::vector<sn_point> points;
    std::vector<std::size_t> active;
    points.reserve(count);

    const auto place = [&](const sn_point &p) {
      const glm::ivec2 c = to_cell(p);
      grid[static_cast<std::size_t>(c.y * grid_size + c.x)] =
        static_cast<int>(points.size());
      active.push_back(points.size());
      points.push_back(p);
    };

    // anything closer than radius lies within two cells on each axis
    const auto is_clear = [&](const sn_point &p) {
      const glm::ivec2 c = to_cell(p);

      for (int dy = -2; dy <= 2; ++dy) {
        for (int dx = -2; dx <= 2; ++dx) {
          const int x = c.x + dx;
          const int y = c.y + dy;
          if (x < 0 || y < 0 || x >= grid_size || y >= grid_size) { continue; }

          const int i = grid[static_cast<std::size_t>(y * grid_size + x)];
          if (i < 0) { continue; }

          const glm::vec2 &q = points[static_cast<std::size_t>(i)].value();
          if (glm::distance(q, p.value()) <= radius) { return false; }
        }
      }

      return true;
    };

    place(sn_point::random(rng));

    while (points.size() < count && !active.empty()) {
      const std::size_t active_index = qgen::random_index(rng, active.size());
      const sn_point p = points[active[active_index]];
      std::optional<sn_point> accepted;

      for (int i = 0; i < generator::poisson_attempts && !accepted; ++i) {
        const float theta = qgen::random_float(rng, 0.0f, qgen::tau);
        const float r = qgen::random_float(rng, radius, radius * 2.0f);

        const sn_point candidate = sn_point::normalised(
          p.value() + glm::vec2(std::cos(theta), std::sin(theta)) * r,
          normaliser, rng
        );

        if (is_clear(candidate)) {
          accepted = candidate;
        }
      }

      if (accepted) {
        place(*accepted);
      } else {
        active.erase(active.begin() + static_cast<std::ptrdiff_t>(active_index));
      }
    }

    return points;
  }

  struct point_builder {
    qgen::random_engine &rng;

    std::vector<sn_point> operator()(const generator::origin &) const {
      return origin_points();
    }

    std::vector<sn_point> operator()(const generator::moore &) const {
      return moore_points();
    }

    std::vector<sn_point> operator()(const generator::von_neumann &) const {
      return von_neumann_points();
    }

    std::vector<sn_point> operator()(const generator::uniform_grid &g) const {
      const unsigned int x_count = g.x_count.value() + 1u;
      const unsigned int y_count = g.y_count.value() + 1u;
      const float x_ratio = 1.0f / static_cast<float>(x_count);
      const float y_ratio = 1.0f / static_cast<float>(y_count);

      std::vector<sn_point> points;
      for (unsigned int x = 0; x < x_count; ++x) {
        for (unsigned int y = 0; y < y_count; ++y) {
          points.emplace_back(
            cell_centre(x, x_ratio, 0.5f), cell_centre(y, y_ratio, 0.5f)
          );
        }
      }

      return points;
    }

    std::vector<sn_point> operator()(const generator::sparse_grid &g) const {
      unsigned int x_count = g.x_count.value() + 1u;
      unsigned int y_count = g.y_count.value() + 1u;
      if (x_count % 2 == 0) { x_count++; }
      if (y_count % 2 == 0) { y_count++; }

      const unsigned int x_mod = g.x_mod.value() ? 1 : 0;
      const unsigned int y_mod = g.y_mod.value() ? 1 : 0;
      const float x_ratio = 1.0f / static_cast<float>(x_count);
      const float y_ratio = 1.0f / static_cast<float>(y_count);

      std::vector<sn_point> points;
      for (unsigned int x = 0; x < x_count; ++x) {
        for (unsigned int y = 0; y < y_count; ++y) {
          if (x % 2 == x_mod && y % 2 == y_mod) { continue; }

          points.emplace_back(
            cell_centre(x, x_ratio, 0.5f), cell_centre(y, y_ratio, 0.5f)
          );
        }
      }

      return points;
    }

    std::vector<sn_point> operator()(const generator::hex_grid &g) const {
      unsigned int x_count = g.x_count.value() + 1u;
      unsigned int y_count = g.y_count.value() + 1u;

      // x_count is brought to 2 mod 3 and y_count to even so the pattern
      // closes at the right and bottom edges
      switch (x_count % 3) {
        case 0: x_count += 2; break;
        case 1: x_count += 1; break;
        default: break;
      }
      if (y_count % 2 == 1) { y_count++; }

      const float x_ratio = 1.0f / static_cast<float>(x_count);
      const float y_ratio = 1.0f / static_cast<float>(y_count);

      std::vector<sn_point> points;
      for (unsigned int x = 0; x < x_count; ++x) {
        for (unsigned int y = 0; y < y_count; ++y) {
          if (y % 2 == x % 3) { continue; }

          const float x_offset = y % 2 == 0 ? 0.25f : 0.75f;
          points.emplace_back(
            cell_centre(x, x_ratio, x_offset), cell_centre(y, y_ratio, 0.5f)
          );
        }
      }

      return points;
    }

    std::vector<sn_point> operator()(const generator::tri_grid &g) const {
      const unsigned int x_count = g.x_count.value() + 1u;
      const unsigned int y_count = g.y_count.value() + 1u;
      const float x_ratio = 1.0f / static_cast<float>(x_count);
      const float y_ratio = 1.0f / static_cast<float>(y_count);

      std::vector<sn_point> points;
      for (unsigned int x = 0; x < x_count; ++x) {
        for (unsigned int y = 0; y < y_count; ++y) {
          const float x_offset = y % 2 == 0 ? 0.25f : 0.75f;
          points.emplace_back(
            cell_centre(x, x_ratio, x_offset), cell_centre(y, y_ratio, 0.5f)
          );
        }
      }

      return points;
    }

    std::vector<sn_point> operator()(
      const generator::uniform_distribution &g
    ) const {
      const std::size_t count = std::max<std::size_t>(g.count.value(), 2);

      std::vector<sn_point> points;
      for (std::size_t i = 0; i < count; ++i) {
        points.push_back(sn_point::random(rng));
      }

      return points;
    }

    std::vector<sn_point> operator()(const generator::poisson &g) const {
      const qgen::sfloat_normaliser normaliser =
        qgen::generate_value<qgen::sfloat_normaliser>(rng, qgen::gen_arg{});

      const float requested = static_cast<float>(g.count.value());
      const float radius = std::max(
        2.0f * g.radius.value() / std::max(std::sqrt(requested), 2.0f), 0.01f
      );

      return poisson_disk(
        rng, std::max<std::size_t>(g.count.value(), 4), radius, normaliser
      );
    }

    std::vector<sn_point> operator()(const generator::spiral &g) const {
      const unsigned int count = std::max<unsigned int>(g.count.value(), 1);
      const float n = static_cast<float>(count);
      const float exponent = g.nonlinearity_factor_halved.value() * 2.0f;

      std::vector<sn_point> points;
      for (unsigned int i = 0; i < count; ++i) {
        const float rho = static_cast<float>(i) / n;
        const float t = g.linear.value() ? rho : std::pow(rho, exponent);
        const float theta = n * g.maximum.value() * g.scalar.value() * t;

        points.push_back(sn_point::from_snfloats(
          qgen::sn_float::clamped(rho * std::sin(theta)),
          qgen::sn_float::clamped(rho * std::cos(theta))
        ));
      }

      return points;
    }

    std::vector<sn_point> operator()(const generator::random_rings &g) const {
      std::vector<unsigned int> sizes;
      for (unsigned int i = 0; i < g.max_rings.value() + 1u; ++i) {
        sizes.push_back(qgen::nibble::random(rng).value() + 1u);
      }

      return ring_points(sizes);
    }

    std::vector<sn_point> operator()(
      const generator::linear_increasing_rings &g
    ) const {
      const unsigned int delta = g.ring_size_delta.value();
      const unsigned int max_count = std::max<unsigned int>(g.max_count.value(), 1);

      return ring_points(ring_sizes(max_count, [delta](const unsigned int k) {
        return k == 0 ? 1u : k * delta;
      }));
    }

    std::vector<sn_point> operator()(const generator::fibonacci_rings &g) const {
      const unsigned int max_count = std::max<unsigned int>(g.max_count.value(), 1);
      return ring_points(ring_sizes(max_count, fibonacci));
    }

    std::vector<sn_point> operator()(const generator::squared_rings &g) const {
      const unsigned int max_count = std::max<unsigned int>(g.max_count.value(), 1);

      return ring_points(ring_sizes(max_count, [](const unsigned int k) {
        return (k + 1) * (k + 1);
      }));
    }
  };

  struct line_writer {
    std::ostream &os;

    void operator()(const generator::origin &) const { os << "Origin"; }
    void operator()(const generator::moore &) const { os << "Moore"; }
    void operator()(const generator::von_neumann &) const { os << "VonNeumann"; }

    void operator()(const generator::uniform_grid &g) const {
      os << "UniformGrid " << g.x_count << " " << g.y_count;
    }

    void operator()(const generator::sparse_grid &g) const {
      os << "SparseGrid " << g.x_count << " " << g.y_count << " "
        << g.x_mod << " " << g.y_mod;
    }

    void operator()(const generator::hex_grid &g) const {
      os << "HexGrid " << g.x_count << " " << g.y_count;
    }

    void operator()(const generator::tri_grid &g) const {
      os << "TriGrid " << g.x_count << " " << g.y_count;
    }

    void operator()(const generator::uniform_distribution &g) const {
      os << "UniformDistribution " << g.count;
    }

    void operator()(const generator::poisson &g) const {
      os << "Poisson " << g.count << " " << g.radius;
    }

    void operator()(const generator::spiral &g) const {
      os << "Spiral " << g.count << " " << g.scalar << " " << g.maximum << " "
        << g.linear << " " << g.nonlinearity_factor_halved;
    }

    void operator()(const generator::random_rings &g) const {
      os << "RandomRings " << g.max_rings;
    }

    void operator()(const generator::linear_increasing_rings &g) const {
      os << "LinearIncreasingRings " << g.max_count << " " << g.ring_size_delta;
    }

    void operator()(const generator::fibonacci_rings &g) const {
      os << "FibonacciRings " << g.max_count;
    }

    void operator()(const generator::squared_rings &g) const {
      os << "SquaredRings " << g.max_count;
    }
  };

  class line_reader {
  public:
    explicit line_reader(const std::string &line) : line(line), in(line) {}

    std::string name() {
      std::string n;
      if (!(in >> n)) { qgen::decode_failure("Empty point set generator"); }
      return n;
    }

    qgen::nibble read_nibble() { return qgen::nibble::from_raw(read<long>()); }
    qgen::byte read_byte() { return qgen::byte::from_raw(read<long>()); }
    qgen::un_float read_un_float() { return qgen::un_float::from_raw(read<float>()); }
    qgen::angle read_angle() { return qgen::angle::from_raw(read<float>()); }

    qgen::boolean read_boolean() {
      const std::string token = read<std::string>();
      if (token == "true" || token == "1") { return qgen::boolean(true); }
      if (token == "false" || token == "0") { return qgen::boolean(false); }
      qgen::decode_failure("Invalid boolean '", token, "' in: ", line);
    }

    void finish() {
      std::string extra;
      if (in >> extra) {
        qgen::decode_failure("Unexpected '", extra, "' in: ", line);
      }
    }

  private:
    template <typename T>
    T read() {
      T value{};
      if (!(in >> value)) {
        qgen::decode_failure("Truncated point set generator: ", line);
      }
      return value;
    }

    std::string line;
    std::istringstream in;
  };
}

qgen::point_set qgen::point_set_generator::generate_point_set(
  random_engine &rng
) const {
  std::vector<sn_point> points = std::visit(point_builder{rng}, g);

  ensure(!points.empty(), "Point set generator produced nothing: ", *this);

  return point_set(
    std::make_shared<const std::vector<sn_point>>(std::move(points)), *this
  );
}

std::string qgen::point_set_generator::to_string() const {
  std::stringstream ss;
  ss << std::setprecision(std::numeric_limits<float>::max_digits10);
  std::visit(line_writer{ss}, g);
  return ss.str();
}

qgen::point_set_generator qgen::point_set_generator::parse(
  const std::string &s
) {
  line_reader in(s);
  const std::string name = in.name();
  point_set_generator result;

  if (name == "Origin") {
    result = origin{};
  } else if (name == "Moore") {
    result = moore{};
  } else if (name == "VonNeumann") {
    result = von_neumann{};
  } else if (name == "UniformGrid") {
    const nibble x = in.read_nibble();
    const nibble y = in.read_nibble();
    result = uniform_grid{x, y};
  } else if (name == "SparseGrid") {
    const nibble x = in.read_nibble();
    const nibble y = in.read_nibble();
    const boolean x_mod = in.read_boolean();
    const boolean y_mod = in.read_boolean();
    result = sparse_grid{x, y, x_mod, y_mod};
  } else if (name == "HexGrid") {
    const nibble x = in.read_nibble();
    const nibble y = in.read_nibble();
    result = hex_grid{x, y};
  } else if (name == "TriGrid") {
    const nibble x = in.read_nibble();
    const nibble y = in.read_nibble();
    result = tri_grid{x, y};
  } else if (name == "UniformDistribution") {
    result = uniform_distribution{in.read_byte()};
  } else if (name == "Poisson") {
    const byte count = in.read_byte();
    const un_float radius = in.read_un_float();
    result = poisson{count, radius};
  } else if (name == "Spiral") {
    const byte count = in.read_byte();
    const un_float scalar = in.read_un_float();
    const angle maximum = in.read_angle();
    const boolean linear = in.read_boolean();
    const un_float factor = in.read_un_float();
    result = spiral{count, scalar, maximum, linear, factor};
  } else if (name == "RandomRings") {
    result = random_rings{in.read_nibble()};
  } else if (name == "LinearIncreasingRings") {
    const byte max_count = in.read_byte();
    const nibble delta = in.read_nibble();
    result = linear_increasing_rings{max_count, delta};
  } else if (name == "FibonacciRings") {
    result = fibonacci_rings{in.read_byte()};
  } else if (name == "SquaredRings") {
    result = squared_rings{in.read_byte()};
  } else {
    decode_failure("Unknown point set generator: ", name);
  }

  in.finish();
  return result;
}

qgen::point_set_generator qgen::point_set_generator::random(
  random_engine &rng
) {
  return generate(rng, gen_arg{});
}

qgen::point_set_generator qgen::point_set_generator::generate(
  random_engine &rng, const gen_arg arg
) {
  switch (random_int(rng, 0, 12)) {
    case 0:
      return moore{};
    case 1:
      return von_neumann{};
    case 2: {
      const nibble x = generate_value<nibble>(rng, arg);
      const nibble y = generate_value<nibble>(rng, arg);
      return uniform_grid{x, y};
    }
    case 3: {
      const nibble x = generate_value<nibble>(rng, arg);
      const nibble y = generate_value<nibble>(rng, arg);
      const boolean x_mod = generate_value<boolean>(rng, arg);
      const boolean y_mod = generate_value<boolean>(rng, arg);
      return sparse_grid{x, y, x_mod, y_mod};
    }
    case 4: {
      const nibble x = generate_value<nibble>(rng, arg);
      const nibble y = generate_value<nibble>(rng, arg);
      return tri_grid{x, y};
    }
    case 5: {
      const nibble x = generate_value<nibble>(rng, arg);
      const nibble y = generate_value<nibble>(rng, arg);
      return hex_grid{x, y};
    }
    case 6:
      return uniform_distribution{generate_value<byte>(rng, arg)};
    case 7: {
      const byte count = generate_value<byte>(rng, arg);
      const un_float radius = generate_value<un_float>(rng, arg);
      return poisson{count, radius};
    }
    case 8: {
      const byte count = generate_value<byte>(rng, arg);
      const un_float scalar = generate_value<un_float>(rng, arg);
      const angle maximum = generate_value<angle>(rng, arg);
      const boolean linear = generate_value<boolean>(rng, arg);
      const un_float factor = generate_value<un_float>(rng, arg);
      return spiral{count, scalar, maximum, linear, factor};
    }
    case 9:
      return random_rings{generate_value<nibble>(rng, arg)};
    case 10: {
      const byte max_count = generate_value<byte>(rng, arg);
      const nibble delta = generate_value<nibble>(rng, arg);
      return linear_increasing_rings{max_count, delta};
    }
    case 11:
      return fibonacci_rings{generate_value<byte>(rng, arg)};
    default:
      return squared_rings{generate_value<byte>(rng, arg)};
  }
}

void qgen::point_set_generator::mutate(random_engine &rng, const mut_arg arg) {
  *this = generate(rng, arg);
}

std::ostream &qgen::operator<<(std::ostream &os, const point_set_generator &g) {
  return os << g.to_string();
}

// point_set

qgen::point_set::point_set()
: point_set(
    std::make_shared<const std::vector<sn_point>>(origin_points()),
    point_set_generator::origin{}
  ) {}

qgen::point_set::point_set(storage points, const point_set_generator &generator)
: pts(std::move(points)), gen(generator) {
  ensure(pts != nullptr, "Point set without storage");
  ensure(!pts->empty(), "Empty point set, generator is ", gen);
  ensure(
    pts->size() <= max_points,
    "Point set of ", pts->size(), " points, generator is ", gen
  );
}

const qgen::sn_point &qgen::point_set::operator[](const std::size_t index) const {
  ensure(
    index < pts->size(),
    "Point index ", index, " out of range for ", pts->size(), " points"
  );
  return (*pts)[index];
}

const qgen::sn_point &qgen::point_set::operator[](const byte index) const {
  return (*this)[static_cast<std::size_t>(index.value())];
}

std::vector<qgen::sn_point> qgen::point_set::get_offsets(
  const std::size_t width, const std::size_t height
) const {
  ensure(width > 0 && height > 0, "Invalid offset grid: ", width, "x", height);

  const sn_point scale(
    1.0f / static_cast<float>(width), 1.0f / static_cast<float>(height)
  );

  std::vector<sn_point> offsets;
  offsets.reserve(pts->size());
  for (const sn_point &p : *pts) {
    offsets.push_back(p.scale_point(scale));
  }

  return offsets;
}

void qgen::point_set::replace(storage points) {
  *this = point_set(std::move(points), gen);
}

qgen::sn_point qgen::point_set::get_closest_point(const sn_point &other) const {
  const sn_point *best = nullptr;
  float best_distance = std::numeric_limits<float>::infinity();

  for (const sn_point &p : *pts) {
    if (p == other) { continue; }

    const float d = glm::distance(p.value(), other.value());
    if (best == nullptr || d < best_distance) {
      best = &p;
      best_distance = d;
    }
  }

  return best != nullptr ? *best : other;
}

qgen::sn_point qgen::point_set::get_furthest_point(const sn_point &other) const {
  const sn_point *best = nullptr;
  float best_distance = -1.0f;

  for (const sn_point &p : *pts) {
    if (p == other) { continue; }

    const float d = glm::distance(p.value(), other.value());
    if (best == nullptr || d > best_distance) {
      best = &p;
      best_distance = d;
    }
  }

  return best != nullptr ? *best : other;
}

std::vector<qgen::sn_point> qgen::point_set::get_n_closest_points(
  const sn_point &other, const std::size_t n
) const {
  std::vector<sn_point> sorted = *pts;

  std::stable_sort(
    sorted.begin(), sorted.end(),
    [&other](const sn_point &a, const sn_point &b) {
      const float da = glm::distance(a.value(), other.value());
      const float db = glm::distance(b.value(), other.value());
      return std::make_pair(da != 0.0f, da) < std::make_pair(db != 0.0f, db);
    }
  );

  sorted.resize(std::min(n, sorted.size()));
  return sorted;
}

qgen::sn_point qgen::point_set::get_random_point(random_engine &rng) const {
  return (*pts)[random_index(rng, pts->size())];
}

std::string qgen::point_set::save() const {
  return gen.to_string();
}

qgen::point_set qgen::point_set::load(const std::string &text) {
  random_engine rng = seeded_from_device();
  return point_set_generator::parse(text).generate_point_set(rng);
}

qgen::point_set qgen::point_set::random(random_engine &rng) {
  return point_set_generator::random(rng).generate_point_set(rng);
}

qgen::point_set qgen::point_set::generate(random_engine &rng, const gen_arg arg) {
  return generate_value<point_set_generator>(rng, arg).generate_point_set(rng);
}

void qgen::point_set::mutate(random_engine &rng, const mut_arg arg) {
  *this = generate(rng, arg);
}
