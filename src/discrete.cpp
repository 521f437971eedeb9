#include <algorithm>
#include <cstdint>
#include <limits>
#include <ostream>

#include "discrete.hpp"
#include "error.hpp"

// boolean

qgen::boolean qgen::boolean::random(random_engine &rng) {
  return boolean(random_bool(rng));
}

qgen::boolean qgen::boolean::generate(random_engine &rng, const gen_arg) {
  return random(rng);
}

void qgen::boolean::mutate(random_engine &rng, const mut_arg) {
  if (random_bool(rng)) {
    *this = random(rng);
  } else {
    v = !v;
  }
}

// nibble

qgen::nibble::nibble(const uint8_t v) : v(v) {
  ensure(v < modulus_value, "Invalid nibble value: ", static_cast<int>(v));
}

qgen::nibble qgen::nibble::circular(const unsigned int v) {
  return nibble(static_cast<uint8_t>(v % modulus_value));
}

qgen::nibble qgen::nibble::from_raw(const long v) {
  if (v < 0 || v >= modulus_value) {
    decode_failure("nibble out of range: ", v);
  }

  return nibble(static_cast<uint8_t>(v));
}

qgen::nibble qgen::nibble::circular_add(const nibble other) const {
  return circular(v + other.v);
}

qgen::nibble qgen::nibble::circular_multiply(const nibble other) const {
  return circular(v * other.v);
}

qgen::nibble qgen::nibble::divide(const nibble other) const {
  if (other.v == 0) { return other; }
  return nibble(v / other.v);
}

qgen::nibble qgen::nibble::modulus(const nibble other) const {
  if (other.v == 0) { return other; }
  return nibble(v % other.v);
}

qgen::nibble qgen::nibble::random(random_engine &rng) {
  return nibble(static_cast<uint8_t>(random_int(rng, 0, modulus_value - 1)));
}

qgen::nibble qgen::nibble::generate(random_engine &rng, const gen_arg) {
  return random(rng);
}

void qgen::nibble::mutate(random_engine &rng, const mut_arg) {
  switch (random_int(rng, 0, 2)) {
    case 0:
      *this = circular(v + 1u);
      break;
    case 1:
      *this = circular(v + modulus_value - 1u);
      break;
    default:
      *this = random(rng);
      break;
  }
}

// byte

qgen::byte qgen::byte::from_raw(const long v) {
  if (v < 0 || v > std::numeric_limits<uint8_t>::max()) {
    decode_failure("byte out of range: ", v);
  }

  return byte(static_cast<uint8_t>(v));
}

qgen::byte qgen::byte::circular_add(const byte other) const {
  return byte(static_cast<uint8_t>(v + other.v));
}

qgen::byte qgen::byte::circular_add_i32(const int32_t other) const {
  const int64_t sum = static_cast<int64_t>(v) + other;
  return byte(static_cast<uint8_t>(((sum % 256) + 256) % 256));
}

qgen::byte qgen::byte::clamped_add_i32(const int32_t other) const {
  const int64_t sum = static_cast<int64_t>(v) + other;
  return byte(static_cast<uint8_t>(std::clamp<int64_t>(sum, 0, 255)));
}

qgen::byte qgen::byte::circular_multiply(const byte other) const {
  return byte(static_cast<uint8_t>(v * other.v));
}

qgen::byte qgen::byte::divide(const byte other) const {
  if (other.v == 0) { return other; }
  return byte(static_cast<uint8_t>(v / other.v));
}

qgen::byte qgen::byte::modulus(const byte other) const {
  if (other.v == 0) { return other; }
  return byte(static_cast<uint8_t>(v % other.v));
}

qgen::byte qgen::byte::invert_wrapped() const {
  return byte(static_cast<uint8_t>(255 - v));
}

qgen::byte qgen::byte::random(random_engine &rng) {
  return byte(static_cast<uint8_t>(random_int(rng, 0, 255)));
}

qgen::byte qgen::byte::generate(random_engine &rng, const gen_arg) {
  return random(rng);
}

void qgen::byte::mutate(random_engine &rng, const mut_arg) {
  switch (random_int(rng, 0, 4)) {
    case 0:
      *this = circular_add_i32(1);
      break;
    case 1:
      *this = circular_add_i32(-1);
      break;
    case 2:
      *this = clamped_add_i32(1);
      break;
    case 3:
      *this = clamped_add_i32(-1);
      break;
    default:
      *this = random(rng);
      break;
  }
}

// unsigned_int

qgen::unsigned_int qgen::unsigned_int::circular_add(
  const unsigned_int other
) const {
  return unsigned_int(v + other.v);
}

qgen::unsigned_int qgen::unsigned_int::circular_multiply(
  const unsigned_int other
) const {
  return unsigned_int(v * other.v);
}

qgen::unsigned_int qgen::unsigned_int::divide(const unsigned_int other) const {
  if (other.v == 0) { return other; }
  return unsigned_int(v / other.v);
}

qgen::unsigned_int qgen::unsigned_int::modulus(
  const unsigned_int other
) const {
  if (other.v == 0) { return other; }
  return unsigned_int(v % other.v);
}

qgen::unsigned_int qgen::unsigned_int::random(random_engine &rng) {
  return unsigned_int(random_bits<uint32_t>(rng));
}

qgen::unsigned_int qgen::unsigned_int::generate(
  random_engine &rng, const gen_arg
) {
  return random(rng);
}

void qgen::unsigned_int::mutate(random_engine &rng, const mut_arg) {
  *this = random(rng);
}

// signed_int, arithmetic goes through uint32_t so overflow wraps

qgen::signed_int qgen::signed_int::circular_add(const signed_int other) const {
  return signed_int(static_cast<int32_t>(
    static_cast<uint32_t>(v) + static_cast<uint32_t>(other.v)
  ));
}

qgen::signed_int qgen::signed_int::circular_multiply(
  const signed_int other
) const {
  return signed_int(static_cast<int32_t>(
    static_cast<uint32_t>(v) * static_cast<uint32_t>(other.v)
  ));
}

qgen::signed_int qgen::signed_int::divide(const signed_int other) const {
  if (other.v == 0) { return other; }

  // INT32_MIN / -1 wraps back to INT32_MIN
  if (other.v == -1) {
    return signed_int(static_cast<int32_t>(0u - static_cast<uint32_t>(v)));
  }

  return signed_int(v / other.v);
}

qgen::signed_int qgen::signed_int::modulus(const signed_int other) const {
  if (other.v == 0) { return other; }
  if (other.v == -1) { return signed_int(0); }
  return signed_int(v % other.v);
}

qgen::signed_int qgen::signed_int::random(random_engine &rng) {
  return signed_int(random_bits<int32_t>(rng));
}

qgen::signed_int qgen::signed_int::generate(random_engine &rng, const gen_arg) {
  return random(rng);
}

void qgen::signed_int::mutate(random_engine &rng, const mut_arg) {
  *this = random(rng);
}

std::ostream &qgen::operator<<(std::ostream &os, const boolean b) {
  return os << (b.value() ? "true" : "false");
}

std::ostream &qgen::operator<<(std::ostream &os, const nibble n) {
  return os << static_cast<int>(n.value());
}

std::ostream &qgen::operator<<(std::ostream &os, const byte b) {
  return os << static_cast<int>(b.value());
}

std::ostream &qgen::operator<<(std::ostream &os, const unsigned_int u) {
  return os << u.value();
}

std::ostream &qgen::operator<<(std::ostream &os, const signed_int s) {
  return os << s.value();
}
