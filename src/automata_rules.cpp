#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include <glm/glm.hpp>

#include "automata_rules.hpp"
#include "error.hpp"

namespace {
  using offsets_t = std::vector<glm::ivec2>;

  const std::array<offsets_t, 15> &offset_table() {
    static const std::array<offsets_t, 15> table = {{
      // vertical
      {{0, -1}, {0, 1}},
      // horizontal
      {{-1, 0}, {1, 0}},
      // diag_left
      {{-1, -1}, {1, 1}},
      // diag_right
      {{1, -1}, {-1, 1}},
      // melt
      {{-1, -1}, {0, -1}, {1, -1}},
      // big_melt
      {{-1, -1}, {0, -1}, {1, -1}, {-1, -2}, {0, -2}, {1, -2}},
      // von_neumann
      {{-1, 0}, {1, 0}, {0, -1}, {0, 1}},
      // anti_von_neumann
      {{-1, -1}, {1, -1}, {-1, 1}, {1, 1}},
      // cross
      {
        {-1, 0}, {-2, 0}, {1, 0}, {2, 0},
        {0, -1}, {0, -2}, {0, 1}, {0, 2}
      },
      // moore
      {
        {-1, -1}, {-1, 0}, {-1, 1}, {0, -1},
        {0, 1}, {1, -1}, {1, 0}, {1, 1}
      },
      // spiral
      {
        {-1, 0}, {-2, 1}, {1, 0}, {2, 1},
        {0, -1}, {1, -2}, {0, 1}, {1, 2}
      },
      // diamond
      {
        {-1, -1}, {-2, 0}, {-1, 1}, {2, 0},
        {1, -1}, {0, -2}, {1, 1}, {0, 2}
      },
      // circle
      {
        {-2, -1}, {-2, 0}, {-2, 1}, {2, -1}, {2, 0}, {2, 1},
        {-1, -2}, {0, -2}, {1, -2}, {-1, 2}, {0, 2}, {1, 2}
      },
      // flower
      {
        {-2, -1}, {-1, 0}, {-2, 1}, {2, -1}, {1, 0}, {2, 1},
        {-1, -2}, {0, -1}, {1, -2}, {-1, 2}, {0, 1}, {1, 2}
      },
      // square
      {
        {-2, -2}, {-2, -1}, {-2, 0}, {-2, 1}, {2, -2}, {2, -1},
        {2, 0}, {2, 1}, {-2, 2}, {-1, -2}, {0, -2}, {1, -2},
        {2, 2}, {-1, 2}, {0, 2}, {1, 2}
      }
    }};

    return table;
  }

  const qgen::bit_color &neighbour(
    const qgen::buffer<qgen::bit_color> &grid,
    const std::size_t x, const std::size_t y, const glm::ivec2 &offset
  ) {
    return grid.get_wrapped(
      static_cast<long>(x) + offset.x, static_cast<long>(y) + offset.y
    );
  }
}

uint8_t qgen::elementary_automata_rule::get_index_from_booleans(
  const boolean l, const boolean c, const boolean r
) {
  uint8_t result = 0;

  if (r.value()) { result |= 1; }
  if (c.value()) { result |= 2; }
  if (l.value()) { result |= 4; }

  return result;
}

qgen::boolean qgen::elementary_automata_rule::get_value_from_booleans(
  const boolean l, const boolean c, const boolean r
) const {
  return p[get_index_from_booleans(l, c, r)];
}

qgen::elementary_automata_rule qgen::elementary_automata_rule::from_wolfram_code(
  const uint8_t code
) {
  pattern_t pattern;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    pattern[i] = boolean((code & (1u << i)) != 0);
  }

  return elementary_automata_rule(pattern);
}

uint8_t qgen::elementary_automata_rule::to_wolfram_code() const {
  uint8_t code = 0;
  for (std::size_t i = 0; i < p.size(); ++i) {
    if (p[i].value()) {
      code |= static_cast<uint8_t>(1u << i);
    }
  }

  return code;
}

qgen::elementary_automata_rule qgen::elementary_automata_rule::generate(
  random_engine &rng, const gen_arg arg
) {
  pattern_t pattern;
  for (boolean &b : pattern) {
    b = generate_value<boolean>(rng, arg);
  }

  return elementary_automata_rule(pattern);
}

void qgen::elementary_automata_rule::mutate(
  random_engine &rng, const mut_arg arg
) {
  if (random_bool(rng)) {
    *this = generate(rng, arg);
    return;
  }

  const std::size_t index = random_index(rng, p.size());
  p[index] = !p[index];
}

bool qgen::operator==(
  const elementary_automata_rule &a, const elementary_automata_rule &b
) {
  return a.pattern() == b.pattern();
}

const std::vector<glm::ivec2> &qgen::pixel_neighbourhood::offsets() const {
  return offset_table()[static_cast<std::size_t>(v)];
}

std::string_view qgen::pixel_neighbourhood::name() const {
  switch (v) {
    case vertical: return "Vertical";
    case horizontal: return "Horizontal";
    case diag_left: return "DiagLeft";
    case diag_right: return "DiagRight";
    case melt: return "Melt";
    case big_melt: return "BigMelt";
    case von_neumann: return "VonNeumann";
    case anti_von_neumann: return "AntiVonNeumann";
    case cross: return "Cross";
    case moore: return "Moore";
    case spiral: return "Spiral";
    case diamond: return "Diamond";
    case circle: return "Circle";
    case flower: return "Flower";
    case square: return "Square";
  }

  return "Unknown";
}

qgen::pixel_neighbourhood qgen::pixel_neighbourhood::random(random_engine &rng) {
  return values[random_index(rng, values.size())];
}

qgen::pixel_neighbourhood qgen::pixel_neighbourhood::generate(
  random_engine &rng, const gen_arg
) {
  return random(rng);
}

void qgen::pixel_neighbourhood::mutate(random_engine &rng, const mut_arg) {
  *this = random(rng);
}

std::ostream &qgen::operator<<(std::ostream &os, const pixel_neighbourhood n) {
  return os << n.name();
}

qgen::neighbour_count_automata_rule::neighbour_count_automata_rule()
: neighbour_count_automata_rule(pixel_neighbourhood::moore) {}

qgen::neighbour_count_automata_rule::neighbour_count_automata_rule(
  const pixel_neighbourhood n
) : n(n) {
  const std::size_t size = axis_size();
  truth_table.resize(size * size * size, bit_color::black);
}

std::size_t qgen::neighbour_count_automata_rule::index(
  const std::size_t r, const std::size_t g, const std::size_t b
) const {
  const std::size_t size = axis_size();
  ensure(
    r < size && g < size && b < size,
    "Neighbour count out of range: ", r, ", ", g, ", ", b
  );

  return (r * size + g) * size + b;
}

qgen::bit_color qgen::neighbour_count_automata_rule::get(
  const std::size_t r, const std::size_t g, const std::size_t b
) const {
  return truth_table[index(r, g, b)];
}

void qgen::neighbour_count_automata_rule::set(
  const std::size_t r, const std::size_t g, const std::size_t b,
  const bit_color c
) {
  truth_table[index(r, g, b)] = c;
}

qgen::bit_color qgen::neighbour_count_automata_rule::next_state(
  const buffer<bit_color> &grid, const std::size_t x, const std::size_t y
) const {
  std::size_t r = 0;
  std::size_t g = 0;
  std::size_t b = 0;

  for (const glm::ivec2 &offset : n.offsets()) {
    const bit_color::components c = neighbour(grid, x, y, offset).to_components();
    if (c[0]) { r++; }
    if (c[1]) { g++; }
    if (c[2]) { b++; }
  }

  return get(r, g, b);
}

qgen::neighbour_count_automata_rule
qgen::neighbour_count_automata_rule::generate(
  random_engine &rng, const gen_arg arg
) {
  neighbour_count_automata_rule rule(generate_value<pixel_neighbourhood>(rng, arg));
  for (bit_color &c : rule.truth_table) {
    c = generate_value<bit_color>(rng, arg);
  }

  return rule;
}

void qgen::neighbour_count_automata_rule::mutate(
  random_engine &rng, const mut_arg arg
) {
  if (random_bool(rng)) {
    *this = generate(rng, arg);
    return;
  }

  const std::size_t size = axis_size();
  const std::size_t r = random_index(rng, size);
  const std::size_t g = random_index(rng, size);
  const std::size_t b = random_index(rng, size);

  set(r, g, b, generate_value<bit_color>(rng, arg));
}

qgen::life_like_table qgen::life_like_table::generate(
  random_engine &rng, const gen_arg arg
) {
  const boolean birth = generate_value<boolean>(rng, arg);
  const boolean survival = generate_value<boolean>(rng, arg);

  return {birth, survival};
}

void qgen::life_like_table::mutate(random_engine &rng, const mut_arg arg) {
  if (random_bool(rng)) {
    *this = generate(rng, arg);
    return;
  }

  if (random_bool(rng)) {
    birth = !birth;
  } else {
    survival = !survival;
  }
}

qgen::indiv_automata_rule::indiv_automata_rule()
: n(pixel_neighbourhood::moore), r(n.offsets().size() + 1) {}

qgen::indiv_automata_rule::indiv_automata_rule(
  const pixel_neighbourhood n, const std::vector<life_like_table> &rules
) : n(n), r(rules) {
  ensure(
    r.size() == n.offsets().size() + 1,
    "Expected ", n.offsets().size() + 1, " life like tables for ", n,
    ", got ", r.size()
  );
}

std::size_t qgen::indiv_automata_rule::count_neighbours(
  const buffer<bit_color> &grid, const std::size_t x, const std::size_t y,
  const bit_color color
) const {
  std::size_t count = 0;
  for (const glm::ivec2 &offset : n.offsets()) {
    if (neighbour(grid, x, y, offset) == color) {
      count++;
    }
  }

  return count;
}

qgen::indiv_automata_rule qgen::indiv_automata_rule::generate(
  random_engine &rng, const gen_arg arg
) {
  const auto neighbourhood = generate_value<pixel_neighbourhood>(rng, arg);

  std::vector<life_like_table> rules;
  for (std::size_t i = 0; i <= neighbourhood.offsets().size(); ++i) {
    rules.push_back(generate_value<life_like_table>(rng, arg));
  }

  return indiv_automata_rule(neighbourhood, rules);
}

void qgen::indiv_automata_rule::mutate(random_engine &rng, const mut_arg arg) {
  if (random_bool(rng)) {
    *this = generate(rng, arg);
    return;
  }

  mutate_value(r[random_index(rng, r.size())], rng, arg);
}

qgen::life_like_automata_rule::life_like_automata_rule() {
  for (std::size_t i = 0; i < order.size(); ++i) {
    order[i] = bit_color::values[i];
  }
}

qgen::life_like_automata_rule::life_like_automata_rule(
  const order_t &color_order, const rules_t &rules
) : order(color_order), color_rules(rules) {
  std::array<bool, 8> seen{};
  for (const bit_color c : order) {
    ensure(!seen[c.to_index()], "Color order repeats ", c);
    seen[c.to_index()] = true;
  }
}

const qgen::indiv_automata_rule &qgen::life_like_automata_rule::rule_for(
  const bit_color c
) const {
  return color_rules[c.to_index()];
}

qgen::bit_color qgen::life_like_automata_rule::next_state(
  const buffer<bit_color> &grid, const std::size_t x, const std::size_t y
) const {
  const bit_color current = grid.at(x, y);

  for (const bit_color c : order) {
    const indiv_automata_rule &rule = rule_for(c);
    const std::size_t count = rule.count_neighbours(grid, x, y, c);
    const life_like_table &table = rule.rules()[count];

    if (current == c ? table.survival.value() : table.birth.value()) {
      return c;
    }
  }

  return bit_color::black;
}

qgen::life_like_automata_rule qgen::life_like_automata_rule::generate(
  random_engine &rng, const gen_arg arg
) {
  order_t color_order;
  for (std::size_t i = 0; i < color_order.size(); ++i) {
    color_order[i] = bit_color::values[i];
  }
  shuffle(color_order, rng);

  rules_t rules;
  for (indiv_automata_rule &rule : rules) {
    rule = generate_value<indiv_automata_rule>(rng, arg);
  }

  return life_like_automata_rule(color_order, rules);
}

void qgen::life_like_automata_rule::mutate(
  random_engine &rng, const mut_arg arg
) {
  if (random_bool(rng)) {
    *this = generate(rng, arg);
    return;
  }

  mutate_value(color_rules[random_index(rng, color_rules.size())], rng, arg);
}
