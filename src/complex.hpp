#ifndef __COMPLEX_HPP__
#define __COMPLEX_HPP__
#include <complex>
#include <ostream>
#include <string>
#include <string_view>

#include "continuous.hpp"
#include "mutagen.hpp"
#include "random.hpp"

namespace qgen {
  class sfloat_normaliser;
  class sn_point;

  // complex number with both parts in [-1, 1]
  class sn_complex {
  public:
    static constexpr std::string_view event_key = "sn_complex";

    sn_complex() = default;
    explicit sn_complex(const std::complex<double> &v);
    sn_complex(const double re, const double im);

    static sn_complex normalised(
      const std::complex<double> &v, const sfloat_normaliser &normaliser,
      random_engine &rng
    );
    static sn_complex from_snfloats(const sn_float re, const sn_float im);
    static sn_complex from_snpoint(const sn_point &p);

    static sn_complex zero() { return sn_complex(); }

    const std::complex<double> &value() const { return v; }
    sn_float re() const;
    sn_float im() const;

    sn_point to_snpoint() const;
    angle to_angle() const;

    sn_complex normalised_add(
      const sn_complex &other, const sfloat_normaliser &normaliser,
      random_engine &rng
    ) const;
    sn_complex lerp(const sn_complex &other, const un_float scalar) const;

    std::string to_string() const;
    static sn_complex parse(const std::string &s);

    static sn_complex random(random_engine &rng);
    static sn_complex generate(random_engine &rng, const gen_arg arg);
    void mutate(random_engine &rng, const mut_arg arg);

  private:
    std::complex<double> v{0.0, 0.0};
  };

  inline bool operator==(const sn_complex &a, const sn_complex &b) {
    return a.value() == b.value();
  }

  std::ostream &operator<<(std::ostream &os, const sn_complex &c);
}

#endif // __COMPLEX_HPP__
