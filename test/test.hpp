#ifndef __TEST_HPP__
#define __TEST_HPP__
// shared harness for the test executables
//
// environment variables:
//   QGEN_FILTER=<pattern>   only run tests whose name matches the regex
//   QGEN_SEED=N             seed for every test's engine (default 12345)
//   QGEN_TEST_VERBOSE=1     print passing checks too
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <regex>
#include <string>

#include "random.hpp"

struct test_config_t {
  bool verbose = false;
  uint32_t seed = 12345;
  const char *filter = nullptr;

  // regex match, plain substring when the filter is not a valid regex
  bool should_run(const std::string &name) const {
    if (filter == nullptr) { return true; }

    try {
      return std::regex_search(name, std::regex(filter));
    } catch (const std::regex_error &) {
      return name.find(filter) != std::string::npos;
    }
  }
};

inline test_config_t global_config;
inline std::size_t global_failure_count = 0;
inline std::size_t global_check_count = 0;

inline void configure_from_environment() {
  if (const char *env = std::getenv("QGEN_TEST_VERBOSE")) {
    global_config.verbose = std::atoi(env) != 0;
  }
  if (const char *env = std::getenv("QGEN_SEED")) {
    global_config.seed = static_cast<uint32_t>(std::strtoul(env, nullptr, 10));
  }
  global_config.filter = std::getenv("QGEN_FILTER");
}

// every test gets its own engine so filtering does not change the draws
inline qgen::random_engine test_engine() {
  return qgen::random_engine(global_config.seed);
}

template <typename F>
void run_if_matches(const std::string &name, F test_fn) {
  if (!global_config.should_run(name)) { return; }

  const std::size_t failures_before = global_failure_count;
  test_fn();

  const bool passed = global_failure_count == failures_before;
  std::cout << (passed ? "  ok   " : "  FAIL ") << name << "\n";
}

inline void check_impl(
  const bool passed, const char *expression, const char *file, const int line
) {
  global_check_count++;

  if (!passed) {
    global_failure_count++;
    std::cerr << "E: " << file << ":" << line << ": " << expression << "\n";
  } else if (global_config.verbose) {
    std::cout << "       " << expression << "\n";
  }
}

inline void check_near_impl(
  const double a, const double b, const double tolerance,
  const char *expression, const char *file, const int line
) {
  const bool passed = std::abs(a - b) <= tolerance;
  check_impl(passed, expression, file, line);

  if (!passed) {
    std::cerr << "   " << a << " vs " << b << ", tolerance " << tolerance << "\n";
  }
}

inline int finish_tests() {
  std::cout << global_check_count << " checks, ";
  std::cout << global_failure_count << " failed, seed ";
  std::cout << global_config.seed << "\n";

  return global_failure_count == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

#define QGEN_CHECK(condition) \
  check_impl(static_cast<bool>(condition), #condition, __FILE__, __LINE__)

#define QGEN_CHECK_NEAR(a, b, tolerance) \
  check_near_impl((a), (b), (tolerance), \
    #a " ~= " #b, __FILE__, __LINE__)

#define QGEN_CHECK_THROWS(expression, exception_type) \
  do { \
    bool thrown = false; \
    try { \
      static_cast<void>(expression); \
    } catch (const exception_type &) { \
      thrown = true; \
    } \
    check_impl(thrown, #expression " throws " #exception_type, \
      __FILE__, __LINE__); \
  } while (false)

#endif // __TEST_HPP__
