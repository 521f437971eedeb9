#ifndef __UTIL_TIMER_HPP__
#define __UTIL_TIMER_HPP__
#include <chrono>

namespace timing {
  using seconds = std::chrono::duration<double>;

  class Clock {
  public:
    using clock_t = std::chrono::steady_clock;

    Clock() : start(clock_t::now()) {}

    // time since the clock was made
    seconds get() const {
      return std::chrono::duration_cast<seconds>(clock_t::now() - start);
    }

  private:
    clock_t::time_point start;
  };

  class Timer {
  public:
    void tick(const seconds now) {
      delta = now - last;
      last = now;
    }

    seconds getDelta() const { return delta; }

  private:
    seconds last{0.0};
    seconds delta{0.0};
  };
}

#endif // __UTIL_TIMER_HPP__
