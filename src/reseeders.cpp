#include <cstddef>
#include <initializer_list>

#include "error.hpp"
#include "reseeders.hpp"

namespace {
  std::size_t random_period(qgen::random_engine &rng) {
    return qgen::random_index(rng, qgen::modulus_reseeder::max_period) + 1;
  }

  // steps through 1..max_period and back round to 1
  std::size_t step_period(const std::size_t v) {
    return (v % qgen::modulus_reseeder::max_period) + 1;
  }
}

qgen::modulus_reseeder::modulus_reseeder()
: modulus_reseeder(
    2, 2, 0, 0,
    {bit_color::black, bit_color::black, bit_color::black, bit_color::white}
  ) {}

qgen::modulus_reseeder::modulus_reseeder(
  const std::size_t x_mod, const std::size_t y_mod,
  const std::size_t x_offset, const std::size_t y_offset,
  const table_t &color_table
) : xm(x_mod), ym(y_mod), xo(x_offset), yo(y_offset), table(color_table) {
  ensure(xm > 0 && ym > 0, "Invalid reseeder modulus: ", xm, ", ", ym);
}

qgen::bit_color qgen::modulus_reseeder::reseed_cell(
  const std::size_t x, const std::size_t y
) const {
  const std::size_t x_index = (x + xo) % xm == 0 ? 1 : 0;
  const std::size_t y_index = (y + yo) % ym == 0 ? 1 : 0;

  return table[x_index * 2 + y_index];
}

void qgen::modulus_reseeder::reseed(buffer<bit_color> &grid) const {
  for (std::size_t y = 0; y < grid.height(); ++y) {
    for (std::size_t x = 0; x < grid.width(); ++x) {
      grid.at(x, y) = reseed_cell(x, y);
    }
  }
}

qgen::modulus_reseeder qgen::modulus_reseeder::generate(
  random_engine &rng, const gen_arg arg
) {
  const std::size_t x_mod = random_period(rng);
  const std::size_t y_mod = random_period(rng);
  const std::size_t x_offset = random_period(rng);
  const std::size_t y_offset = random_period(rng);

  table_t color_table;
  for (bit_color &c : color_table) {
    c = generate_value<bit_color>(rng, arg);
  }

  return {x_mod, y_mod, x_offset, y_offset, color_table};
}

// every field independently may be resampled, stepped, or both
void qgen::modulus_reseeder::mutate(random_engine &rng, const mut_arg arg) {
  for (std::size_t *v : {&xm, &xo, &ym, &yo}) {
    if (random_bool(rng)) { *v = random_period(rng); }
    if (random_bool(rng)) { *v = step_period(*v); }
  }

  if (random_bool(rng)) {
    table[random_index(rng, table.size())] = generate_value<bit_color>(rng, arg);
  }
}
