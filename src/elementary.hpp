#ifndef __ELEMENTARY_HPP__
#define __ELEMENTARY_HPP__
#include <cstdint>
#include <vector>

#include "automata_rules.hpp"
#include "discrete.hpp"
#include "random.hpp"

namespace qgen {
  using generation = std::vector<boolean>;

  // on cells are black, off cells white
  std::vector<uint8_t> cells_to_colour(const generation &g);

  class elementary {
  public:
    elementary() = default;
    elementary(const int w, const int h, const elementary_automata_rule &r);

    void init_single_0();
    void init_single_1();
    void init_alternate();
    void init_random(random_engine &rng);
    void set_rule(const elementary_automata_rule &r);
    const elementary_automata_rule &rule() const { return current_rule; }

    const generation &get() const;
    // cells past either end of the row count as off
    void next();
    void reset();

    int field_width = 0;
    int field_height = 0;
  private:
    generation current_generation;
    elementary_automata_rule current_rule;
  };
}

#endif // __ELEMENTARY_HPP__
