#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "automata_rules.hpp"
#include "automaton.hpp"
#include "buffers.hpp"
#include "colors.hpp"
#include "elementary.hpp"
#include "error.hpp"
#include "reseeders.hpp"

#include "test.hpp"

namespace {
  using qgen::bit_color;
  using qgen::boolean;

  const boolean on(true);
  const boolean off(false);

  std::string as_string(const qgen::generation &g) {
    std::string result;
    for (const boolean b : g) {
      result += b.value() ? '1' : '0';
    }
    return result;
  }

  // table of nine entries for the moore neighbourhood, birth at one count
  qgen::indiv_automata_rule birth_at(const std::size_t count) {
    std::vector<qgen::life_like_table> tables(9);
    tables[count].birth = on;
    return qgen::indiv_automata_rule(qgen::pixel_neighbourhood::moore, tables);
  }

  void test_rule_110() {
    const auto rule = qgen::elementary_automata_rule::from_wolfram_code(110);

    QGEN_CHECK(rule.get_value_from_booleans(on, on, on) == off);
    QGEN_CHECK(rule.get_value_from_booleans(on, on, off) == on);
    QGEN_CHECK(rule.get_value_from_booleans(on, off, on) == on);
    QGEN_CHECK(rule.get_value_from_booleans(on, off, off) == off);
    QGEN_CHECK(rule.get_value_from_booleans(off, on, on) == on);
    QGEN_CHECK(rule.get_value_from_booleans(off, on, off) == on);
    QGEN_CHECK(rule.get_value_from_booleans(off, off, on) == on);
    QGEN_CHECK(rule.get_value_from_booleans(off, off, off) == off);

    QGEN_CHECK(qgen::elementary_automata_rule::get_index_from_booleans(on, off, off) == 4);
    QGEN_CHECK(qgen::elementary_automata_rule::get_index_from_booleans(off, on, off) == 2);
    QGEN_CHECK(qgen::elementary_automata_rule::get_index_from_booleans(off, off, on) == 1);
  }

  void test_wolfram_codes() {
    for (unsigned int code = 0; code < 256; ++code) {
      const auto rule = qgen::elementary_automata_rule::from_wolfram_code(
        static_cast<uint8_t>(code)
      );
      QGEN_CHECK(rule.to_wolfram_code() == code);
    }

    qgen::random_engine rng = test_engine();
    auto rule = qgen::elementary_automata_rule::from_wolfram_code(30);
    for (int i = 0; i < 100; ++i) {
      qgen::mutate_value(rule, rng, {});
      QGEN_CHECK(
        qgen::elementary_automata_rule::from_wolfram_code(rule.to_wolfram_code()) ==
        rule
      );
    }
  }

  void test_elementary_steps() {
    qgen::elementary ca(
      5, 3, qgen::elementary_automata_rule::from_wolfram_code(254)
    );
    QGEN_CHECK(as_string(ca.get()) == "00100");

    ca.next();
    QGEN_CHECK(as_string(ca.get()) == "01110");
    ca.next();
    ca.next();
    QGEN_CHECK(as_string(ca.get()) == "11111");

    ca.init_alternate();
    QGEN_CHECK(as_string(ca.get()) == "01010");

    const std::vector<uint8_t> colours = qgen::cells_to_colour(ca.get());
    QGEN_CHECK(colours.size() == 15);
    QGEN_CHECK(colours[0] == 255 && colours[3] == 0 && colours[5] == 0);

    QGEN_CHECK_THROWS(
      qgen::elementary(0, 3, qgen::elementary_automata_rule()),
      qgen::invariant_error
    );
  }

  void test_elementary_edges() {
    // only the lone centre cell survives, the last cell reads its missing
    // right neighbour as off
    qgen::elementary ca(4, 1, qgen::elementary_automata_rule::from_wolfram_code(4));
    ca.init_single_0();
    QGEN_CHECK(as_string(ca.get()) == "1101");

    ca.next();
    QGEN_CHECK(as_string(ca.get()) == "0001");

    qgen::random_engine rng = test_engine();
    ca.init_random(rng);
    QGEN_CHECK(ca.get().size() == 4);
  }

  void test_neighbourhoods() {
    for (const auto v : qgen::pixel_neighbourhood::values) {
      const qgen::pixel_neighbourhood n(v);
      QGEN_CHECK(!n.offsets().empty());
      QGEN_CHECK(!n.name().empty());

      for (const glm::ivec2 &o : n.offsets()) {
        QGEN_CHECK(o != glm::ivec2(0, 0));
      }
    }

    QGEN_CHECK(qgen::pixel_neighbourhood(qgen::pixel_neighbourhood::moore).offsets().size() == 8);
    QGEN_CHECK(qgen::pixel_neighbourhood(qgen::pixel_neighbourhood::square).offsets().size() == 16);
    QGEN_CHECK(qgen::pixel_neighbourhood(qgen::pixel_neighbourhood::melt).offsets().size() == 3);
    QGEN_CHECK(qgen::pixel_neighbourhood().name() == "Moore");
  }

  void test_neighbour_count_rule() {
    qgen::neighbour_count_automata_rule rule(qgen::pixel_neighbourhood::vertical);
    QGEN_CHECK(rule.axis_size() == 3);
    QGEN_CHECK(rule.get(2, 2, 2) == bit_color::black);
    QGEN_CHECK_THROWS(rule.get(3, 0, 0), qgen::invariant_error);

    rule.set(1, 0, 0, bit_color::green);

    qgen::color_grid grid(3, 3, bit_color::black);
    grid.at(1, 0) = bit_color::red;

    QGEN_CHECK(rule.next_state(grid, 1, 1) == bit_color::green);
    // wraps from the bottom row to the top
    QGEN_CHECK(rule.next_state(grid, 1, 2) == bit_color::green);
    QGEN_CHECK(rule.next_state(grid, 0, 1) == bit_color::black);

    grid.at(1, 2) = bit_color::yellow;
    rule.set(2, 1, 0, bit_color::blue);
    QGEN_CHECK(rule.next_state(grid, 1, 1) == bit_color::blue);
  }

  void test_life_like_precedence() {
    const qgen::life_like_automata_rule::order_t red_first = {
      bit_color::red, bit_color::green, bit_color::black, bit_color::blue,
      bit_color::cyan, bit_color::magenta, bit_color::yellow, bit_color::white
    };
    const qgen::life_like_automata_rule::order_t green_first = {
      bit_color::green, bit_color::red, bit_color::black, bit_color::blue,
      bit_color::cyan, bit_color::magenta, bit_color::yellow, bit_color::white
    };

    qgen::life_like_automata_rule::rules_t rules;
    rules[bit_color(bit_color::red).to_index()] = birth_at(1);
    rules[bit_color(bit_color::green).to_index()] = birth_at(0);

    qgen::color_grid grid(5, 5, bit_color::black);
    grid.at(2, 2) = bit_color::red;

    const qgen::life_like_automata_rule a(red_first, rules);
    QGEN_CHECK(a.next_state(grid, 1, 1) == bit_color::red);
    QGEN_CHECK(a.next_state(grid, 3, 2) == bit_color::red);
    // no red neighbours and no red survival, green is born instead
    QGEN_CHECK(a.next_state(grid, 2, 2) == bit_color::green);
    QGEN_CHECK(a.next_state(grid, 0, 0) == bit_color::green);

    const qgen::life_like_automata_rule b(green_first, rules);
    QGEN_CHECK(b.next_state(grid, 1, 1) == bit_color::green);

    const qgen::life_like_automata_rule nothing;
    QGEN_CHECK(nothing.next_state(grid, 2, 2) == bit_color::black);
    QGEN_CHECK(nothing.next_state(grid, 1, 1) == bit_color::black);

    qgen::life_like_automata_rule::order_t repeated = red_first;
    repeated[7] = bit_color::red;
    QGEN_CHECK_THROWS(
      qgen::life_like_automata_rule(repeated, rules), qgen::invariant_error
    );
  }

  void test_indiv_rule() {
    QGEN_CHECK_THROWS(
      qgen::indiv_automata_rule(
        qgen::pixel_neighbourhood::von_neumann,
        std::vector<qgen::life_like_table>(9)
      ),
      qgen::invariant_error
    );
    QGEN_CHECK(qgen::indiv_automata_rule().rules().size() == 9);

    qgen::color_grid grid(4, 4, bit_color::black);
    grid.at(0, 0) = bit_color::cyan;
    grid.at(2, 1) = bit_color::cyan;
    grid.at(1, 2) = bit_color::blue;

    const qgen::indiv_automata_rule rule;
    QGEN_CHECK(rule.count_neighbours(grid, 1, 1, bit_color::cyan) == 2);
    QGEN_CHECK(rule.count_neighbours(grid, 1, 1, bit_color::blue) == 1);
    QGEN_CHECK(rule.count_neighbours(grid, 1, 1, bit_color::black) == 5);
    // wraps around both edges
    QGEN_CHECK(rule.count_neighbours(grid, 3, 3, bit_color::cyan) == 1);
  }

  void test_reseeder() {
    const qgen::modulus_reseeder checker;
    QGEN_CHECK(checker.reseed_cell(0, 0) == bit_color::white);
    QGEN_CHECK(checker.reseed_cell(1, 0) == bit_color::black);
    QGEN_CHECK(checker.reseed_cell(0, 1) == bit_color::black);
    QGEN_CHECK(checker.reseed_cell(2, 4) == bit_color::white);

    const qgen::modulus_reseeder stripes(
      3, 1, 1, 0,
      {bit_color::red, bit_color::green, bit_color::blue, bit_color::yellow}
    );
    qgen::color_grid grid(6, 2);
    stripes.reseed(grid);
    QGEN_CHECK(grid.at(0, 0) == bit_color::green);
    QGEN_CHECK(grid.at(2, 1) == bit_color::yellow);
    QGEN_CHECK(grid.at(5, 0) == bit_color::yellow);

    QGEN_CHECK_THROWS(
      qgen::modulus_reseeder(0, 1, 0, 0, checker.color_table()),
      qgen::invariant_error
    );

    qgen::random_engine rng = test_engine();
    qgen::modulus_reseeder r = qgen::generate_value<qgen::modulus_reseeder>(rng, {});
    for (int i = 0; i < 500; ++i) {
      qgen::mutate_value(r, rng, {});
      QGEN_CHECK(r.x_mod() >= 1 && r.x_mod() <= qgen::modulus_reseeder::max_period);
      QGEN_CHECK(r.y_mod() >= 1 && r.y_mod() <= qgen::modulus_reseeder::max_period);
    }
  }

  void test_automaton_step() {
    qgen::neighbour_count_automata_rule rule(qgen::pixel_neighbourhood::vertical);
    rule.set(1, 0, 0, bit_color::green);

    qgen::automaton ca(5, 5, rule);
    QGEN_CHECK(ca.field_width() == 5 && ca.field_height() == 5);
    QGEN_CHECK(ca.rule().index() == 1);

    ca.init_reseeder(qgen::modulus_reseeder(
      5, 5, 0, 0,
      {bit_color::black, bit_color::black, bit_color::black, bit_color::red}
    ));
    QGEN_CHECK(ca.get().at(0, 0) == bit_color::red);
    QGEN_CHECK(ca.get().at(1, 1) == bit_color::black);

    ca.next();
    QGEN_CHECK(ca.get().at(0, 1) == bit_color::green);
    QGEN_CHECK(ca.get().at(0, 4) == bit_color::green);
    QGEN_CHECK(ca.get().at(0, 0) == bit_color::black);
    QGEN_CHECK(ca.get().at(2, 2) == bit_color::black);

    // green never counts towards red, so everything goes dark
    ca.next();
    for (const bit_color c : ca.get().data()) {
      QGEN_CHECK(c == bit_color::black);
    }

    const std::vector<uint8_t> colours = qgen::cells_to_colour(ca.get());
    QGEN_CHECK(colours.size() == 5 * 5 * 3);

    ca.set_rule(qgen::life_like_automata_rule());
    QGEN_CHECK(ca.rule().index() == 0);
  }

  void test_mutation_keeps_shape() {
    qgen::random_engine rng = test_engine();

    auto count_rule = qgen::generate_value<qgen::neighbour_count_automata_rule>(rng, {});
    auto life_rule = qgen::generate_value<qgen::life_like_automata_rule>(rng, {});

    for (int i = 0; i < 200; ++i) {
      qgen::mutate_value(count_rule, rng, {});
      qgen::mutate_value(life_rule, rng, {});

      const std::size_t last = count_rule.axis_size() - 1;
      QGEN_CHECK(count_rule.get(last, last, last).to_index() < 8);

      for (const bit_color c : life_rule.color_order()) {
        const qgen::indiv_automata_rule &r = life_rule.rule_for(c);
        QGEN_CHECK(r.rules().size() == r.neighbourhood().offsets().size() + 1);
      }
    }

    qgen::automaton ca(16, 16, life_rule);
    ca.init_random(rng);
    for (int i = 0; i < 5; ++i) {
      ca.next();
    }
    QGEN_CHECK(ca.get().data().size() == 256);
  }
}

int main(int argc, const char *argv[]) {
  configure_from_environment();

  run_if_matches("rule_110", test_rule_110);
  run_if_matches("wolfram_codes", test_wolfram_codes);
  run_if_matches("elementary_steps", test_elementary_steps);
  run_if_matches("elementary_edges", test_elementary_edges);
  run_if_matches("neighbourhoods", test_neighbourhoods);
  run_if_matches("neighbour_count_rule", test_neighbour_count_rule);
  run_if_matches("life_like_precedence", test_life_like_precedence);
  run_if_matches("indiv_rule", test_indiv_rule);
  run_if_matches("reseeder", test_reseeder);
  run_if_matches("automaton_step", test_automaton_step);
  run_if_matches("mutation_keeps_shape", test_mutation_keeps_shape);

  return finish_tests();
}
