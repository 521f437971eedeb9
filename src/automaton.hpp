#ifndef __AUTOMATON_HPP__
#define __AUTOMATON_HPP__
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "automata_rules.hpp"
#include "buffers.hpp"
#include "colors.hpp"
#include "random.hpp"
#include "reseeders.hpp"

namespace qgen {
  using color_grid = buffer<bit_color>;

  // rgb bytes, row by row
  std::vector<uint8_t> cells_to_colour(const color_grid &g);

  // two dimensional automaton over bit colors, every cell of the next grid
  // is computed from the current one
  class automaton {
  public:
    using rule_t = std::variant<
      life_like_automata_rule, neighbour_count_automata_rule
    >;

    automaton(const std::size_t w, const std::size_t h, const rule_t &r);
    automaton(const automaton &) = delete;
    automaton &operator=(const automaton &) = delete;

    void init_random(random_engine &rng);
    void init_reseeder(const modulus_reseeder &r);
    void set_rule(const rule_t &r);
    const rule_t &rule() const { return current_rule; }

    const color_grid &get() const { return *current; }
    void next();

    std::size_t field_width() const { return current->width(); }
    std::size_t field_height() const { return current->height(); }

  private:
    color_grid a;
    color_grid b;
    color_grid *current;
    color_grid *working;
    rule_t current_rule;
  };
}

#endif // __AUTOMATON_HPP__
