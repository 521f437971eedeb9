#ifndef __DISCRETE_HPP__
#define __DISCRETE_HPP__
#include <cstdint>
#include <ostream>
#include <string_view>

#include "mutagen.hpp"
#include "random.hpp"

namespace qgen {
  class boolean {
  public:
    static constexpr std::string_view event_key = "boolean";

    constexpr boolean() = default;
    constexpr explicit boolean(const bool v) : v(v) {}

    constexpr bool value() const { return v; }
    constexpr explicit operator bool() const { return v; }
    constexpr boolean operator!() const { return boolean(!v); }

    static boolean random(random_engine &rng);
    static boolean generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    bool v = false;
  };

  constexpr bool operator==(const boolean a, const boolean b) {
    return a.value() == b.value();
  }
  constexpr bool operator!=(const boolean a, const boolean b) {
    return !(a == b);
  }

  // integer modulo 16
  class nibble {
  public:
    static constexpr std::string_view event_key = "nibble";
    static constexpr uint8_t modulus_value = 16;

    constexpr nibble() = default;
    explicit nibble(const uint8_t v);

    static nibble circular(const unsigned int v);
    static nibble from_raw(const long v);

    constexpr uint8_t value() const { return v; }

    nibble circular_add(const nibble other) const;
    nibble circular_multiply(const nibble other) const;
    nibble divide(const nibble other) const;
    nibble modulus(const nibble other) const;

    static nibble random(random_engine &rng);
    static nibble generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    uint8_t v = 0;
  };

  // wrapping 8 bit integer, with saturating variants where asked for
  class byte {
  public:
    static constexpr std::string_view event_key = "byte";

    constexpr byte() = default;
    constexpr explicit byte(const uint8_t v) : v(v) {}

    static byte from_raw(const long v);

    constexpr uint8_t value() const { return v; }

    byte circular_add(const byte other) const;
    byte circular_add_i32(const int32_t other) const;
    byte clamped_add_i32(const int32_t other) const;
    byte circular_multiply(const byte other) const;
    byte divide(const byte other) const;
    byte modulus(const byte other) const;
    byte invert_wrapped() const;

    static byte random(random_engine &rng);
    static byte generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    uint8_t v = 0;
  };

  class unsigned_int {
  public:
    static constexpr std::string_view event_key = "unsigned_int";

    constexpr unsigned_int() = default;
    constexpr explicit unsigned_int(const uint32_t v) : v(v) {}

    constexpr uint32_t value() const { return v; }

    unsigned_int circular_add(const unsigned_int other) const;
    unsigned_int circular_multiply(const unsigned_int other) const;
    unsigned_int divide(const unsigned_int other) const;
    unsigned_int modulus(const unsigned_int other) const;

    static unsigned_int random(random_engine &rng);
    static unsigned_int generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    uint32_t v = 0;
  };

  // two's complement wrapping 32 bit integer
  class signed_int {
  public:
    static constexpr std::string_view event_key = "signed_int";

    constexpr signed_int() = default;
    constexpr explicit signed_int(const int32_t v) : v(v) {}

    constexpr int32_t value() const { return v; }

    signed_int circular_add(const signed_int other) const;
    signed_int circular_multiply(const signed_int other) const;
    signed_int divide(const signed_int other) const;
    signed_int modulus(const signed_int other) const;

    static signed_int random(random_engine &rng);
    static signed_int generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    int32_t v = 0;
  };

  constexpr bool operator==(const nibble a, const nibble b) {
    return a.value() == b.value();
  }
  constexpr bool operator!=(const nibble a, const nibble b) {
    return !(a == b);
  }
  constexpr bool operator==(const byte a, const byte b) {
    return a.value() == b.value();
  }
  constexpr bool operator!=(const byte a, const byte b) {
    return !(a == b);
  }
  constexpr bool operator==(const unsigned_int a, const unsigned_int b) {
    return a.value() == b.value();
  }
  constexpr bool operator==(const signed_int a, const signed_int b) {
    return a.value() == b.value();
  }

  std::ostream &operator<<(std::ostream &os, const boolean b);
  std::ostream &operator<<(std::ostream &os, const nibble n);
  std::ostream &operator<<(std::ostream &os, const byte b);
  std::ostream &operator<<(std::ostream &os, const unsigned_int u);
  std::ostream &operator<<(std::ostream &os, const signed_int s);
}

#endif // __DISCRETE_HPP__
