#ifndef __ERROR_HPP__
#define __ERROR_HPP__
#include <sstream>
#include <stdexcept>
#include <string>

namespace qgen {
  // a trusted value broke its bounds, always a programming error
  class invariant_error : public std::logic_error {
  public:
    using std::logic_error::logic_error;
  };

  // external text or numbers could not be turned into a valid value
  class decode_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  template <typename... Args>
  void ensure(const bool condition, const Args &...args) {
    if (condition) { return; }

    std::stringstream ss;
    (ss << ... << args);
    throw invariant_error(ss.str());
  }

  template <typename... Args>
  [[noreturn]] void decode_failure(const Args &...args) {
    std::stringstream ss;
    (ss << ... << args);
    throw decode_error(ss.str());
  }
}

#endif // __ERROR_HPP__
