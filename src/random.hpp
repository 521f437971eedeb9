#ifndef __RANDOM_HPP__
#define __RANDOM_HPP__
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <random>

namespace qgen {
  using random_engine = std::mt19937;

  // closed interval, the distribution can land on hi through rounding
  inline float random_float(random_engine &rng, const float lo, const float hi) {
    std::uniform_real_distribution<float> d{lo, hi};
    return std::clamp(d(rng), lo, hi);
  }

  inline double random_double(
    random_engine &rng, const double lo, const double hi
  ) {
    std::uniform_real_distribution<double> d{lo, hi};
    return std::clamp(d(rng), lo, hi);
  }

  inline int random_int(random_engine &rng, const int lo, const int hi) {
    std::uniform_int_distribution d{lo, hi};
    return d(rng);
  }

  inline std::size_t random_index(random_engine &rng, const std::size_t n) {
    std::uniform_int_distribution<std::size_t> d{0, n - 1};
    return d(rng);
  }

  inline bool random_bool(random_engine &rng) {
    std::bernoulli_distribution d{0.5};
    return d(rng);
  }

  template <typename T>
  T random_bits(random_engine &rng) {
    std::uniform_int_distribution<uint32_t> d{};
    return static_cast<T>(d(rng));
  }

  template <typename C>
  void shuffle(C &container, random_engine &rng) {
    std::shuffle(std::begin(container), std::end(container), rng);
  }

  inline random_engine seeded_from_device() {
    random_engine engine;
    engine.seed(std::random_device{}());
    return engine;
  }
}

#endif // __RANDOM_HPP__
