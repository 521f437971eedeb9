#include <cstddef>
#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

#include "automaton.hpp"

std::vector<uint8_t> qgen::cells_to_colour(const qgen::color_grid &g) {
  std::vector<uint8_t> colours;
  colours.reserve(g.width() * g.height() * 3);

  for (const bit_color c : g.data()) {
    const byte_color bc = c.get_color();
    colours.push_back(bc.r.value());
    colours.push_back(bc.g.value());
    colours.push_back(bc.b.value());
  }

  return colours;
}

qgen::automaton::automaton(
  const std::size_t w, const std::size_t h, const rule_t &r
) : a(w, h), b(w, h), current(&a), working(&b), current_rule(r) {}

void qgen::automaton::init_random(random_engine &rng) {
  for (std::size_t y = 0; y < current->height(); ++y) {
    for (std::size_t x = 0; x < current->width(); ++x) {
      current->at(x, y) = bit_color::random(rng);
    }
  }
}

void qgen::automaton::init_reseeder(const modulus_reseeder &r) {
  r.reseed(*current);
}

void qgen::automaton::set_rule(const rule_t &r) {
  current_rule = r;
}

void qgen::automaton::next() {
  for (std::size_t y = 0; y < current->height(); ++y) {
    for (std::size_t x = 0; x < current->width(); ++x) {
      working->at(x, y) = std::visit([&](const auto &rule) {
        return rule.next_state(*current, x, y);
      }, current_rule);
    }
  }

  std::swap(current, working);
}
