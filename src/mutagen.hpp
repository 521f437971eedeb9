#ifndef __MUTAGEN_HPP__
#define __MUTAGEN_HPP__
#include <functional>
#include <string_view>

#include "random.hpp"

// generation, mutation and update capabilities shared by every kernel type.
//
// a type T takes part by providing
//   static constexpr std::string_view event_key;
//   static T generate(random_engine &rng, gen_arg arg);
//   void mutate(random_engine &rng, mut_arg arg);
//
// composite types build their fields through generate_value/mutate_value so
// that whoever listens on the hook sees every nested event.
namespace qgen {
  enum class event_kind { generate, mutate, update };

  struct event {
    event_kind kind;
    std::string_view key;
  };

  using event_hook = std::function<void(const event &)>;

  struct gen_arg {
    const event_hook *hook = nullptr;

    void notify(const event_kind kind, const std::string_view key) const {
      if (hook != nullptr && *hook) {
        (*hook)(event{kind, key});
      }
    }
  };

  struct mut_arg {
    const event_hook *hook = nullptr;

    void notify(const event_kind kind, const std::string_view key) const {
      if (hook != nullptr && *hook) {
        (*hook)(event{kind, key});
      }
    }

    // a mutation that resamples from scratch generates with the same hook
    operator gen_arg() const { return gen_arg{hook}; }
  };

  struct upd_arg {
    const event_hook *hook = nullptr;

    void notify(const event_kind kind, const std::string_view key) const {
      if (hook != nullptr && *hook) {
        (*hook)(event{kind, key});
      }
    }
  };

  template <typename T>
  T generate_value(random_engine &rng, const gen_arg arg) {
    arg.notify(event_kind::generate, T::event_key);
    return T::generate(rng, arg);
  }

  template <typename T>
  void mutate_value(T &value, random_engine &rng, const mut_arg arg) {
    arg.notify(event_kind::mutate, T::event_key);
    value.mutate(rng, arg);
  }

  // none of the kernel types carry per-frame state, so an update is only
  // reported
  template <typename T>
  void update_value(T &, const upd_arg arg) {
    arg.notify(event_kind::update, T::event_key);
  }
}

#endif // __MUTAGEN_HPP__
