#ifndef __COLORS_HPP__
#define __COLORS_HPP__
#include <array>
#include <cstddef>
#include <ostream>
#include <string_view>

#include "complex.hpp"
#include "continuous.hpp"
#include "discrete.hpp"
#include "mutagen.hpp"
#include "random.hpp"

namespace qgen {
  class bit_color;
  struct float_color;

  struct byte_color {
    static constexpr std::string_view event_key = "byte_color";

    byte r;
    byte g;
    byte b;
    byte a;

    static byte_color from(const float_color &c);

    // steps each channel up by one where other has it and down where it
    // doesn't, wrapping
    byte_color add_bit_color(const bit_color other) const;

    static byte_color random(random_engine &rng);
    static byte_color generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);
  };

  struct nibble_color {
    static constexpr std::string_view event_key = "nibble_color";

    nibble r;
    nibble g;
    nibble b;
    nibble a;

    static nibble_color from(const float_color &c);

    static nibble_color random(random_engine &rng);
    static nibble_color generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);
  };

  // one bit each of red, green and blue
  class bit_color {
  public:
    enum value_t { black, red, green, blue, cyan, magenta, yellow, white };
    using components = std::array<bool, 3>;

    static constexpr std::string_view event_key = "bit_color";
    static constexpr std::array<value_t, 8> values = {
      black, red, green, blue, cyan, magenta, yellow, white
    };

    constexpr bit_color() = default;
    constexpr bit_color(const value_t v) : v(v) {}
    constexpr operator value_t() const { return v; }

    static bit_color from_index(const std::size_t index);
    static bit_color from_components(const components &c);
    static bit_color from(const float_color &c);
    static bit_color from(const byte_color &c);

    std::size_t to_index() const { return static_cast<std::size_t>(v); }
    components to_components() const;
    byte_color get_color() const;

    // true when the two colors share any channel
    bool has_color(const bit_color other) const;
    components give_color(const bit_color other) const;
    components take_color(const bit_color other) const;
    components xor_color(const bit_color other) const;
    components eq_color(const bit_color other) const;

    static bit_color random(random_engine &rng);
    static bit_color generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    value_t v = black;
  };

  struct hsv_color;
  struct cmyk_color;
  struct lab_color;

  struct float_color {
    static constexpr std::string_view event_key = "float_color";

    un_float r;
    un_float g;
    un_float b;
    un_float a;

    static float_color all_zero();
    static float_color white();
    static float_color black();

    static float_color from(const byte_color &c);
    static float_color from(const bit_color c);
    static float_color from(const hsv_color &c);
    static float_color from(const cmyk_color &c);
    static float_color from(const lab_color &c);

    // mean of r, g and b
    float get_average() const;
    un_float get_hue_unfloat() const;
    un_float get_saturation_unfloat() const;
    un_float get_value_unfloat() const;

    float_color lerp(const float_color &other, const un_float scalar) const;

    static float_color random(random_engine &rng);
    static float_color generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);
  };

  struct hsv_color {
    static constexpr std::string_view event_key = "hsv_color";

    // radians, 0 is red
    angle h;
    un_float s;
    un_float v;
    un_float a;

    static hsv_color all_zero();
    static hsv_color white();
    static hsv_color black();

    static hsv_color from(const float_color &c);

    hsv_color offset_hue(const angle hue) const;
    hsv_color lerp(const hsv_color &other, const un_float scalar) const;

    static hsv_color random(random_engine &rng);
    static hsv_color generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);
  };

  struct cmyk_color {
    static constexpr std::string_view event_key = "cmyk_color";

    un_float c;
    un_float m;
    un_float y;
    un_float k;
    un_float a;

    static cmyk_color all_zero();
    static cmyk_color white();
    static cmyk_color black();

    static cmyk_color from(const float_color &c);

    cmyk_color lerp(const cmyk_color &other, const un_float scalar) const;

    static cmyk_color random(random_engine &rng);
    static cmyk_color generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);
  };

  // CIE L*a*b* with l / 100 and (a, b) / 127 packed into bounded types
  struct lab_color {
    static constexpr std::string_view event_key = "lab_color";
    static constexpr float l_scale = 100.0f;
    static constexpr float ab_scale = 127.0f;

    sn_float l;
    sn_complex ab;
    un_float alpha;

    static lab_color all_zero();
    static lab_color white();
    static lab_color black();

    static lab_color from(const float_color &c);

    lab_color lerp(const lab_color &other, const un_float scalar) const;

    static lab_color random(random_engine &rng);
    static lab_color generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);
  };

  inline bool operator==(const byte_color &x, const byte_color &y) {
    return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
  }
  inline bool operator==(const float_color &x, const float_color &y) {
    return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
  }

  std::ostream &operator<<(std::ostream &os, const bit_color c);
  std::ostream &operator<<(std::ostream &os, const byte_color &c);
  std::ostream &operator<<(std::ostream &os, const float_color &c);
}

#endif // __COLORS_HPP__
