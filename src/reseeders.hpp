#ifndef __RESEEDERS_HPP__
#define __RESEEDERS_HPP__
#include <array>
#include <cstddef>
#include <string_view>

#include "buffers.hpp"
#include "colors.hpp"
#include "mutagen.hpp"
#include "random.hpp"

namespace qgen {
  // fills a grid with a repeating pattern, each cell picks from a 2x2 table
  // by whether its shifted x and y land on a multiple of x_mod and y_mod
  class modulus_reseeder {
  public:
    using table_t = std::array<bit_color, 4>;

    static constexpr std::string_view event_key = "modulus_reseeder";
    // largest period and offset that generate and mutate produce
    static constexpr std::size_t max_period = 16;

    modulus_reseeder();
    modulus_reseeder(
      const std::size_t x_mod, const std::size_t y_mod,
      const std::size_t x_offset, const std::size_t y_offset,
      const table_t &color_table
    );

    std::size_t x_mod() const { return xm; }
    std::size_t y_mod() const { return ym; }
    std::size_t x_offset() const { return xo; }
    std::size_t y_offset() const { return yo; }
    const table_t &color_table() const { return table; }

    bit_color reseed_cell(const std::size_t x, const std::size_t y) const;
    void reseed(buffer<bit_color> &grid) const;

    static modulus_reseeder generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    std::size_t xm;
    std::size_t ym;
    std::size_t xo;
    std::size_t yo;
    table_t table;
  };
}

#endif // __RESEEDERS_HPP__
