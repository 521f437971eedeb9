#ifndef __AUTOMATA_RULES_HPP__
#define __AUTOMATA_RULES_HPP__
#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

#include "buffers.hpp"
#include "colors.hpp"
#include "discrete.hpp"
#include "mutagen.hpp"
#include "random.hpp"

namespace qgen {
  // one dimensional binary rule, entry i is the next state for the
  // neighbourhood whose bits (l, c, r) spell i
  class elementary_automata_rule {
  public:
    using pattern_t = std::array<boolean, 8>;

    static constexpr std::string_view event_key = "elementary_automata_rule";

    elementary_automata_rule() = default;
    explicit elementary_automata_rule(const pattern_t &p) : p(p) {}

    static uint8_t get_index_from_booleans(
      const boolean l, const boolean c, const boolean r
    );
    boolean get_value_from_booleans(
      const boolean l, const boolean c, const boolean r
    ) const;

    static elementary_automata_rule from_wolfram_code(const uint8_t code);
    uint8_t to_wolfram_code() const;

    const pattern_t &pattern() const { return p; }

    static elementary_automata_rule generate(
      random_engine &rng, const gen_arg arg
    );
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    pattern_t p{};
  };

  bool operator==(
    const elementary_automata_rule &a, const elementary_automata_rule &b
  );

  // fixed pattern of integer offsets around a cell
  class pixel_neighbourhood {
  public:
    enum value_t {
      vertical, horizontal, diag_left, diag_right, melt, big_melt,
      von_neumann, anti_von_neumann, cross, moore, spiral, diamond,
      circle, flower, square
    };

    static constexpr std::string_view event_key = "pixel_neighbourhood";
    static constexpr std::array<value_t, 15> values = {
      vertical, horizontal, diag_left, diag_right, melt, big_melt,
      von_neumann, anti_von_neumann, cross, moore, spiral, diamond,
      circle, flower, square
    };

    constexpr pixel_neighbourhood() = default;
    constexpr pixel_neighbourhood(const value_t v) : v(v) {}
    constexpr operator value_t() const { return v; }

    const std::vector<glm::ivec2> &offsets() const;
    std::string_view name() const;

    static pixel_neighbourhood random(random_engine &rng);
    static pixel_neighbourhood generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    value_t v = moore;
  };

  std::ostream &operator<<(std::ostream &os, const pixel_neighbourhood n);

  // next color looked up by how many neighbours have red, green and blue on
  class neighbour_count_automata_rule {
  public:
    static constexpr std::string_view event_key =
      "neighbour_count_automata_rule";

    neighbour_count_automata_rule();
    explicit neighbour_count_automata_rule(const pixel_neighbourhood n);

    pixel_neighbourhood neighbourhood() const { return n; }
    // counts run from 0 to the neighbourhood size on every axis
    std::size_t axis_size() const { return n.offsets().size() + 1; }

    bit_color get(
      const std::size_t r, const std::size_t g, const std::size_t b
    ) const;
    void set(
      const std::size_t r, const std::size_t g, const std::size_t b,
      const bit_color c
    );

    bit_color next_state(
      const buffer<bit_color> &grid, const std::size_t x, const std::size_t y
    ) const;

    static neighbour_count_automata_rule generate(
      random_engine &rng, const gen_arg arg
    );
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    std::size_t index(
      const std::size_t r, const std::size_t g, const std::size_t b
    ) const;

    pixel_neighbourhood n;
    std::vector<bit_color> truth_table;
  };

  struct life_like_table {
    static constexpr std::string_view event_key = "life_like_table";

    boolean birth;
    boolean survival;

    static life_like_table generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);
  };

  // birth and survival for one color, one entry per possible count of
  // same colored neighbours
  class indiv_automata_rule {
  public:
    static constexpr std::string_view event_key = "indiv_automata_rule";

    indiv_automata_rule();
    indiv_automata_rule(
      const pixel_neighbourhood n, const std::vector<life_like_table> &rules
    );

    pixel_neighbourhood neighbourhood() const { return n; }
    const std::vector<life_like_table> &rules() const { return r; }

    std::size_t count_neighbours(
      const buffer<bit_color> &grid, const std::size_t x, const std::size_t y,
      const bit_color color
    ) const;

    static indiv_automata_rule generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    pixel_neighbourhood n;
    std::vector<life_like_table> r;
  };

  // one indiv_automata_rule per bit color, colors earlier in color_order
  // win when several would claim the same cell
  class life_like_automata_rule {
  public:
    using order_t = std::array<bit_color, 8>;
    using rules_t = std::array<indiv_automata_rule, 8>;

    static constexpr std::string_view event_key = "life_like_automata_rule";

    life_like_automata_rule();
    life_like_automata_rule(const order_t &color_order, const rules_t &rules);

    const order_t &color_order() const { return order; }
    const indiv_automata_rule &rule_for(const bit_color c) const;

    // black when no color fires
    bit_color next_state(
      const buffer<bit_color> &grid, const std::size_t x, const std::size_t y
    ) const;

    static life_like_automata_rule generate(
      random_engine &rng, const gen_arg arg
    );
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    order_t order;
    rules_t color_rules;
  };
}

#endif // __AUTOMATA_RULES_HPP__
