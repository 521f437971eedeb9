#ifndef __BUFFERS_HPP__
#define __BUFFERS_HPP__
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

#include "discrete.hpp"
#include "error.hpp"
#include "mutagen.hpp"
#include "points.hpp"
#include "random.hpp"

namespace qgen {
  // width x height grid of T stored row by row
  template <typename T>
  class buffer {
  public:
    static constexpr std::string_view event_key = "buffer";
    static constexpr std::size_t default_size = 255;

    buffer() : buffer(default_size, default_size) {}

    buffer(const std::size_t w, const std::size_t h, const T &fill = T{})
    : w(w), h(h), cells(w * h, fill) {
      ensure(w > 0 && h > 0, "Invalid buffer size: ", w, "x", h);
    }

    std::size_t width() const { return w; }
    std::size_t height() const { return h; }

    // -1 maps to the first cell and 1 to the last
    glm::uvec2 point_to_uint(const sn_point &p) const {
      const auto axis = [](const float u, const std::size_t size) {
        const auto scaled = static_cast<std::size_t>(
          std::round(u * static_cast<float>(size))
        );
        return static_cast<unsigned int>(std::min(scaled, size - 1));
      };

      return {
        axis(p.x().to_unsigned().value(), w),
        axis(p.y().to_unsigned().value(), h)
      };
    }

    T &at(const std::size_t x, const std::size_t y) {
      ensure(x < w && y < h, "Buffer index out of range: ", x, ", ", y);
      return cells[y * w + x];
    }

    const T &at(const std::size_t x, const std::size_t y) const {
      ensure(x < w && y < h, "Buffer index out of range: ", x, ", ", y);
      return cells[y * w + x];
    }

    T &operator[](const sn_point &p) {
      const glm::uvec2 c = point_to_uint(p);
      return cells[c.y * w + c.x];
    }

    const T &operator[](const sn_point &p) const {
      const glm::uvec2 c = point_to_uint(p);
      return cells[c.y * w + c.x];
    }

    // toroidal lookup, any integer coordinate is valid
    const T &get_wrapped(const long x, const long y) const {
      const long sw = static_cast<long>(w);
      const long sh = static_cast<long>(h);
      const long wx = ((x % sw) + sw) % sw;
      const long wy = ((y % sh) + sh) % sh;

      return cells[static_cast<std::size_t>(wy) * w + static_cast<std::size_t>(wx)];
    }

    void fill(const T &value) {
      std::fill(cells.begin(), cells.end(), value);
    }

    // bresenham, both end points are drawn
    void draw_line(const sn_point &from, const sn_point &to, const T &value) {
      const glm::ivec2 a(point_to_uint(from));
      const glm::ivec2 b(point_to_uint(to));

      const int dx = std::abs(b.x - a.x);
      const int dy = -std::abs(b.y - a.y);
      const int sx = a.x < b.x ? 1 : -1;
      const int sy = a.y < b.y ? 1 : -1;
      int error = dx + dy;

      glm::ivec2 p = a;
      while (true) {
        cells[static_cast<std::size_t>(p.y) * w + static_cast<std::size_t>(p.x)] =
          value;
        if (p == b) { break; }

        const int e2 = 2 * error;
        if (e2 >= dy) {
          error += dy;
          p.x += sx;
        }
        if (e2 <= dx) {
          error += dx;
          p.y += sy;
        }
      }
    }

    void draw_dot(const sn_point &p, const T &value) {
      (*this)[p] = value;
    }

    const std::vector<T> &data() const { return cells; }

    // the contents are not saved, only the dimensions
    std::string save() const {
      std::stringstream ss;
      ss << w << " " << h;
      return ss.str();
    }

    static buffer load(const std::string &text) {
      std::stringstream ss(text);
      long lw = 0;
      long lh = 0;
      std::string rest;

      if (!(ss >> lw >> lh) || (ss >> rest)) {
        decode_failure("Invalid buffer description: \"", text, "\"");
      }
      if (lw <= 0 || lh <= 0) {
        decode_failure("Invalid buffer size: ", lw, "x", lh);
      }

      return buffer(static_cast<std::size_t>(lw), static_cast<std::size_t>(lh));
    }

    static buffer generate(random_engine &rng, const gen_arg arg) {
      const std::size_t gw = generate_value<byte>(rng, arg).value() + 1u;
      const std::size_t gh = generate_value<byte>(rng, arg).value() + 1u;

      buffer result(gw, gh);
      for (T &cell : result.cells) {
        cell = generate_value<T>(rng, arg);
      }

      return result;
    }

    // per cell mutation only produces noise, contents are left alone
    void mutate(random_engine &, const mut_arg) {}

  private:
    std::size_t w;
    std::size_t h;
    std::vector<T> cells;
  };
}

#endif // __BUFFERS_HPP__
