#include <algorithm>
#include <cmath>
#include <cstddef>
#include <ostream>

#include <boost/gil.hpp>
#include <boost/gil/extension/toolbox/color_spaces/hsv.hpp>
#include <boost/gil/extension/toolbox/color_spaces/lab.hpp>

#include "colors.hpp"
#include "error.hpp"
#include "util.hpp"

namespace gil = boost::gil;

namespace {
  struct hsv_triple {
    float h;
    float s;
    float v;
  };

  hsv_triple rgb_to_hsv(const float r, const float g, const float b) {
    const gil::rgb32f_pixel_t rgb(r, g, b);
    gil::hsv32f_pixel_t hsv;
    gil::color_convert(rgb, hsv);

    float h = gil::get_color(hsv, gil::hsv_color_space::hue_t());
    if (!(h >= 0.0f && h < 1.0f)) { h = 0.0f; }

    return {
      h,
      std::clamp<float>(gil::get_color(hsv, gil::hsv_color_space::saturation_t()), 0.0f, 1.0f),
      std::clamp<float>(gil::get_color(hsv, gil::hsv_color_space::value_t()), 0.0f, 1.0f)
    };
  }

  // hue in [0, 1)
  gil::rgb32f_pixel_t hsv_to_rgb(const float h, const float s, const float v) {
    const gil::hsv32f_pixel_t hsv(std::min(h, 0.99999f), s, v);
    gil::rgb32f_pixel_t rgb;
    gil::color_convert(hsv, rgb);
    return rgb;
  }

  float channel(const gil::rgb32f_pixel_t &p, const std::size_t i) {
    return std::clamp<float>(p[i], 0.0f, 1.0f);
  }

  // [-pi, pi] with 0 at red onto [0, 1)
  float angle_to_hue(const qgen::angle h) {
    float h01 = h.value() / qgen::tau;
    if (h01 < 0.0f) { h01 += 1.0f; }
    if (!(h01 < 1.0f)) { h01 = 0.0f; }
    return h01;
  }
}

// byte_color

qgen::byte_color qgen::byte_color::from(const float_color &c) {
  const auto to_byte = [](const un_float f) {
    return byte(static_cast<uint8_t>(std::lround(f.value() * 255.0f)));
  };

  return {to_byte(c.r), to_byte(c.g), to_byte(c.b), to_byte(c.a)};
}

qgen::byte_color qgen::byte_color::add_bit_color(const bit_color other) const {
  const bit_color::components o = other.to_components();

  return {
    r.circular_add_i32(o[0] ? 1 : -1),
    g.circular_add_i32(o[1] ? 1 : -1),
    b.circular_add_i32(o[2] ? 1 : -1),
    a
  };
}

qgen::byte_color qgen::byte_color::random(random_engine &rng) {
  const byte r = byte::random(rng);
  const byte g = byte::random(rng);
  const byte b = byte::random(rng);
  const byte a = byte::random(rng);
  return {r, g, b, a};
}

qgen::byte_color qgen::byte_color::generate(
  random_engine &rng, const gen_arg arg
) {
  byte_color c;
  c.r = generate_value<byte>(rng, arg);
  c.g = generate_value<byte>(rng, arg);
  c.b = generate_value<byte>(rng, arg);
  c.a = generate_value<byte>(rng, arg);
  return c;
}

void qgen::byte_color::mutate(random_engine &rng, const mut_arg arg) {
  switch (random_int(rng, 0, 3)) {
    case 0: mutate_value(r, rng, arg); break;
    case 1: mutate_value(g, rng, arg); break;
    case 2: mutate_value(b, rng, arg); break;
    default: mutate_value(a, rng, arg); break;
  }
}

// nibble_color

qgen::nibble_color qgen::nibble_color::from(const float_color &c) {
  const auto to_nibble = [](const un_float f) {
    const float scaled = std::min(f.value() * 16.0f, 15.0f);
    return nibble(static_cast<uint8_t>(scaled));
  };

  return {to_nibble(c.r), to_nibble(c.g), to_nibble(c.b), to_nibble(c.a)};
}

qgen::nibble_color qgen::nibble_color::random(random_engine &rng) {
  return generate(rng, gen_arg{});
}

qgen::nibble_color qgen::nibble_color::generate(
  random_engine &rng, const gen_arg arg
) {
  nibble_color c;
  c.r = generate_value<nibble>(rng, arg);
  c.g = generate_value<nibble>(rng, arg);
  c.b = generate_value<nibble>(rng, arg);
  c.a = generate_value<nibble>(rng, arg);
  return c;
}

void qgen::nibble_color::mutate(random_engine &rng, const mut_arg arg) {
  switch (random_int(rng, 0, 3)) {
    case 0: mutate_value(r, rng, arg); break;
    case 1: mutate_value(g, rng, arg); break;
    case 2: mutate_value(b, rng, arg); break;
    default: mutate_value(a, rng, arg); break;
  }
}

// bit_color

qgen::bit_color qgen::bit_color::from_index(const std::size_t index) {
  ensure(index < values.size(), "Invalid bit_color index: ", index);
  return values[index];
}

qgen::bit_color qgen::bit_color::from_components(const components &c) {
  const auto [r, g, b] = c;

  if (r && g && b) { return white; }
  if (r && g) { return yellow; }
  if (r && b) { return magenta; }
  if (g && b) { return cyan; }
  if (r) { return red; }
  if (g) { return green; }
  if (b) { return blue; }
  return black;
}

qgen::bit_color qgen::bit_color::from(const float_color &c) {
  return from_components({
    c.r.value() >= 0.5f, c.g.value() >= 0.5f, c.b.value() >= 0.5f
  });
}

qgen::bit_color qgen::bit_color::from(const byte_color &c) {
  return from_components({
    c.r.value() > 127, c.g.value() > 127, c.b.value() > 127
  });
}

qgen::bit_color::components qgen::bit_color::to_components() const {
  switch (v) {
    case black: return {false, false, false};
    case red: return {true, false, false};
    case green: return {false, true, false};
    case blue: return {false, false, true};
    case cyan: return {false, true, true};
    case magenta: return {true, false, true};
    case yellow: return {true, true, false};
    case white: return {true, true, true};
  }

  return {false, false, false};
}

qgen::byte_color qgen::bit_color::get_color() const {
  const components c = to_components();
  const auto full = [](const bool on) { return byte(on ? 255 : 0); };

  return {full(c[0]), full(c[1]), full(c[2]), byte(255)};
}

bool qgen::bit_color::has_color(const bit_color other) const {
  const components x = to_components();
  const components y = other.to_components();

  bool result = false;
  for (std::size_t i = 0; i < 3; ++i) {
    result = result || (x[i] && y[i]);
  }

  return result;
}

qgen::bit_color::components qgen::bit_color::give_color(
  const bit_color other
) const {
  const components x = to_components();
  const components y = other.to_components();
  return {x[0] || y[0], x[1] || y[1], x[2] || y[2]};
}

qgen::bit_color::components qgen::bit_color::take_color(
  const bit_color other
) const {
  const components x = to_components();
  const components y = other.to_components();
  return {x[0] && !y[0], x[1] && !y[1], x[2] && !y[2]};
}

qgen::bit_color::components qgen::bit_color::xor_color(
  const bit_color other
) const {
  const components x = to_components();
  const components y = other.to_components();
  return {x[0] != y[0], x[1] != y[1], x[2] != y[2]};
}

qgen::bit_color::components qgen::bit_color::eq_color(
  const bit_color other
) const {
  const components x = to_components();
  const components y = other.to_components();
  return {x[0] == y[0], x[1] == y[1], x[2] == y[2]};
}

qgen::bit_color qgen::bit_color::random(random_engine &rng) {
  const bool r = random_bool(rng);
  const bool g = random_bool(rng);
  const bool b = random_bool(rng);
  return from_components({r, g, b});
}

qgen::bit_color qgen::bit_color::generate(random_engine &rng, const gen_arg) {
  return random(rng);
}

void qgen::bit_color::mutate(random_engine &rng, const mut_arg) {
  components c = to_components();

  for (bool &channel : c) {
    if (random_bool(rng)) {
      channel = random_bool(rng);
    }
  }

  *this = from_components(c);
}

// float_color

qgen::float_color qgen::float_color::all_zero() {
  return {un_float::zero(), un_float::zero(), un_float::zero(), un_float::zero()};
}

qgen::float_color qgen::float_color::white() {
  return {un_float::one(), un_float::one(), un_float::one(), un_float::one()};
}

qgen::float_color qgen::float_color::black() {
  return {un_float::zero(), un_float::zero(), un_float::zero(), un_float::one()};
}

qgen::float_color qgen::float_color::from(const byte_color &c) {
  const auto to_float = [](const byte b) {
    return un_float(static_cast<float>(b.value()) / 255.0f);
  };

  return {to_float(c.r), to_float(c.g), to_float(c.b), to_float(c.a)};
}

qgen::float_color qgen::float_color::from(const bit_color c) {
  return from(c.get_color());
}

qgen::float_color qgen::float_color::from(const hsv_color &c) {
  const gil::rgb32f_pixel_t rgb = hsv_to_rgb(
    angle_to_hue(c.h), c.s.value(), c.v.value()
  );

  return {
    un_float(channel(rgb, 0)), un_float(channel(rgb, 1)),
    un_float(channel(rgb, 2)), c.a
  };
}

qgen::float_color qgen::float_color::from(const cmyk_color &c) {
  const float k = 1.0f - c.k.value();

  return {
    un_float::clamped((1.0f - c.c.value()) * k),
    un_float::clamped((1.0f - c.m.value()) * k),
    un_float::clamped((1.0f - c.y.value()) * k),
    c.a
  };
}

qgen::float_color qgen::float_color::from(const lab_color &c) {
  const gil::lab32f_pixel_t lab(
    c.l.value() * lab_color::l_scale,
    c.ab.re().value() * lab_color::ab_scale,
    c.ab.im().value() * lab_color::ab_scale
  );
  gil::rgb32f_pixel_t rgb;
  gil::color_convert(lab, rgb);

  const auto to_float = [](const float f) {
    return std::isfinite(f) ? un_float::clamped(f) : un_float::zero();
  };

  return {
    to_float(rgb[0]), to_float(rgb[1]), to_float(rgb[2]), c.alpha
  };
}

float qgen::float_color::get_average() const {
  return (r.value() + g.value() + b.value()) / 3.0f;
}

qgen::un_float qgen::float_color::get_hue_unfloat() const {
  return un_float::clamped(rgb_to_hsv(r.value(), g.value(), b.value()).h);
}

qgen::un_float qgen::float_color::get_saturation_unfloat() const {
  return un_float(rgb_to_hsv(r.value(), g.value(), b.value()).s);
}

qgen::un_float qgen::float_color::get_value_unfloat() const {
  return un_float(rgb_to_hsv(r.value(), g.value(), b.value()).v);
}

qgen::float_color qgen::float_color::lerp(
  const float_color &other, const un_float scalar
) const {
  return {
    r.lerp(other.r, scalar), g.lerp(other.g, scalar),
    b.lerp(other.b, scalar), a.lerp(other.a, scalar)
  };
}

qgen::float_color qgen::float_color::random(random_engine &rng) {
  return generate(rng, gen_arg{});
}

qgen::float_color qgen::float_color::generate(
  random_engine &rng, const gen_arg arg
) {
  float_color c;
  c.r = generate_value<un_float>(rng, arg);
  c.g = generate_value<un_float>(rng, arg);
  c.b = generate_value<un_float>(rng, arg);
  c.a = generate_value<un_float>(rng, arg);
  return c;
}

void qgen::float_color::mutate(random_engine &rng, const mut_arg arg) {
  *this = generate(rng, arg);
}

// hsv_color

qgen::hsv_color qgen::hsv_color::all_zero() {
  return {angle::zero(), un_float::zero(), un_float::zero(), un_float::zero()};
}

qgen::hsv_color qgen::hsv_color::white() {
  return {angle::zero(), un_float::zero(), un_float::one(), un_float::one()};
}

qgen::hsv_color qgen::hsv_color::black() {
  return {angle::zero(), un_float::zero(), un_float::zero(), un_float::one()};
}

qgen::hsv_color qgen::hsv_color::from(const float_color &c) {
  const hsv_triple hsv = rgb_to_hsv(c.r.value(), c.g.value(), c.b.value());

  return {
    angle::wrapped(hsv.h * tau), un_float(hsv.s), un_float(hsv.v), c.a
  };
}

qgen::hsv_color qgen::hsv_color::offset_hue(const angle hue) const {
  return {h + hue, s, v, a};
}

qgen::hsv_color qgen::hsv_color::lerp(
  const hsv_color &other, const un_float scalar
) const {
  return {
    h.lerp(other.h, scalar), s.lerp(other.s, scalar),
    v.lerp(other.v, scalar), a.lerp(other.a, scalar)
  };
}

qgen::hsv_color qgen::hsv_color::random(random_engine &rng) {
  return generate(rng, gen_arg{});
}

qgen::hsv_color qgen::hsv_color::generate(
  random_engine &rng, const gen_arg arg
) {
  hsv_color c;
  c.h = generate_value<angle>(rng, arg);
  c.s = generate_value<un_float>(rng, arg);
  c.v = generate_value<un_float>(rng, arg);
  c.a = generate_value<un_float>(rng, arg);
  return c;
}

void qgen::hsv_color::mutate(random_engine &rng, const mut_arg arg) {
  *this = generate(rng, arg);
}

// cmyk_color

qgen::cmyk_color qgen::cmyk_color::all_zero() {
  const un_float z = un_float::zero();
  return {z, z, z, z, z};
}

qgen::cmyk_color qgen::cmyk_color::white() {
  const un_float z = un_float::zero();
  return {z, z, z, z, un_float::one()};
}

qgen::cmyk_color qgen::cmyk_color::black() {
  const un_float z = un_float::zero();
  return {z, z, z, un_float::one(), un_float::one()};
}

qgen::cmyk_color qgen::cmyk_color::from(const float_color &rgb) {
  const float r = rgb.r.value();
  const float g = rgb.g.value();
  const float b = rgb.b.value();
  const float m = std::max({r, g, b});

  if (m <= 0.0f) {
    cmyk_color result = black();
    result.a = rgb.a;
    return result;
  }

  return {
    un_float::clamped((m - r) / m),
    un_float::clamped((m - g) / m),
    un_float::clamped((m - b) / m),
    un_float::clamped(1.0f - m),
    rgb.a
  };
}

qgen::cmyk_color qgen::cmyk_color::lerp(
  const cmyk_color &other, const un_float scalar
) const {
  return {
    c.lerp(other.c, scalar), m.lerp(other.m, scalar), y.lerp(other.y, scalar),
    k.lerp(other.k, scalar), a.lerp(other.a, scalar)
  };
}

qgen::cmyk_color qgen::cmyk_color::random(random_engine &rng) {
  return generate(rng, gen_arg{});
}

qgen::cmyk_color qgen::cmyk_color::generate(
  random_engine &rng, const gen_arg arg
) {
  cmyk_color result;
  result.c = generate_value<un_float>(rng, arg);
  result.m = generate_value<un_float>(rng, arg);
  result.y = generate_value<un_float>(rng, arg);
  result.k = generate_value<un_float>(rng, arg);
  result.a = generate_value<un_float>(rng, arg);
  return result;
}

void qgen::cmyk_color::mutate(random_engine &rng, const mut_arg arg) {
  *this = generate(rng, arg);
}

// lab_color

qgen::lab_color qgen::lab_color::all_zero() {
  return {sn_float::zero(), sn_complex::zero(), un_float::zero()};
}

qgen::lab_color qgen::lab_color::white() {
  return {sn_float::one(), sn_complex::zero(), un_float::one()};
}

qgen::lab_color qgen::lab_color::black() {
  return {sn_float::zero(), sn_complex::zero(), un_float::one()};
}

qgen::lab_color qgen::lab_color::from(const float_color &c) {
  const gil::rgb32f_pixel_t rgb(c.r.value(), c.g.value(), c.b.value());
  gil::lab32f_pixel_t lab;
  gil::color_convert(rgb, lab);

  const float l = gil::get_color(lab, gil::lab_color_space::luminance_t());
  const float a = gil::get_color(lab, gil::lab_color_space::a_color_opponent_t());
  const float b = gil::get_color(lab, gil::lab_color_space::b_color_opponent_t());

  return {
    sn_float::clamped(l / l_scale),
    sn_complex(
      std::clamp(a / ab_scale, -1.0f, 1.0f),
      std::clamp(b / ab_scale, -1.0f, 1.0f)
    ),
    c.a
  };
}

qgen::lab_color qgen::lab_color::lerp(
  const lab_color &other, const un_float scalar
) const {
  return {
    l.lerp(other.l, scalar), ab.lerp(other.ab, scalar),
    alpha.lerp(other.alpha, scalar)
  };
}

qgen::lab_color qgen::lab_color::random(random_engine &rng) {
  return generate(rng, gen_arg{});
}

qgen::lab_color qgen::lab_color::generate(
  random_engine &rng, const gen_arg arg
) {
  lab_color c;
  c.l = generate_value<sn_float>(rng, arg);
  c.ab = generate_value<sn_complex>(rng, arg);
  c.alpha = generate_value<un_float>(rng, arg);
  return c;
}

void qgen::lab_color::mutate(random_engine &rng, const mut_arg arg) {
  *this = generate(rng, arg);
}

std::ostream &qgen::operator<<(std::ostream &os, const bit_color c) {
  static constexpr std::string_view names[] = {
    "Black", "Red", "Green", "Blue", "Cyan", "Magenta", "Yellow", "White"
  };

  return os << names[c.to_index()];
}

std::ostream &qgen::operator<<(std::ostream &os, const byte_color &c) {
  return os << "(" << c.r << ", " << c.g << ", " << c.b << ", " << c.a << ")";
}

std::ostream &qgen::operator<<(std::ostream &os, const float_color &c) {
  return os << "(" << c.r << ", " << c.g << ", " << c.b << ", " << c.a << ")";
}
