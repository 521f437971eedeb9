#include <cstdint>
#include <vector>

#include "elementary.hpp"
#include "error.hpp"

namespace {
  constexpr uint8_t off_colour = 255;
  constexpr uint8_t on_colour = 0;
}

std::vector<uint8_t> qgen::cells_to_colour(const qgen::generation &g) {
  std::vector<uint8_t> colours;

  for (const auto &c : g) {
    const uint8_t v = c.value() ? on_colour : off_colour;
    colours.push_back(v);
    colours.push_back(v);
    colours.push_back(v);
  }

  return colours;
}

qgen::elementary::elementary(
  const int w, const int h, const elementary_automata_rule &r
) : field_width(w), field_height(h), current_rule(r) {
  ensure(w > 0 && h > 0, "Invalid field size: ", w, "x", h);
  init_single_1();
}

void qgen::elementary::init_single_0() {
  reset();
  current_generation.assign(field_width, boolean(true));
  current_generation[field_width / 2] = boolean(false);
}

void qgen::elementary::init_single_1() {
  reset();
  current_generation.assign(field_width, boolean(false));
  current_generation[field_width / 2] = boolean(true);
}

void qgen::elementary::init_alternate() {
  reset();
  for (int i = 0; i < field_width; ++i) {
    current_generation.push_back(boolean(i % 2 == 1));
  }
}

void qgen::elementary::init_random(random_engine &rng) {
  reset();
  for (int i = 0; i < field_width; ++i) {
    current_generation.push_back(boolean::random(rng));
  }
}

void qgen::elementary::set_rule(const elementary_automata_rule &r) {
  current_rule = r;
}

const qgen::generation &qgen::elementary::get() const {
  return current_generation;
}

void qgen::elementary::next() {
  const int size = static_cast<int>(current_generation.size());
  generation next_generation(current_generation.size());

  for (int i = 0; i < size; ++i) {
    const boolean l = i != 0 ? current_generation[i - 1] : boolean(false);
    const boolean r = i != size - 1 ? current_generation[i + 1] : boolean(false);

    next_generation[i] = current_rule.get_value_from_booleans(
      l, current_generation[i], r
    );
  }

  current_generation = next_generation;
}

void qgen::elementary::reset() {
  current_generation.clear();
}
