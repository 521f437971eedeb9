#ifndef __KEY_BINDINGS_HPP__
#define __KEY_BINDINGS_HPP__
#include <functional>
#include <string_view>
#include <vector>

#include "gl/gl.hpp"

enum class automaton_mode { elementary, life_like, neighbour_count };

struct game_state {
  automaton_mode mode = automaton_mode::life_like;
  bool is_paused = false;
  bool is_single_step = false;
  bool do_reset_texture = false;
  bool do_save_texture = false;
  bool do_reseed_modulus = false;
  bool do_reseed_random = false;
  bool do_new_rule = false;
  bool do_mutate_rule = false;
  bool do_cycle_mode = false;
  int gen_count = 0;
  int save_count = 0;
};

using key_f = std::function<void(game_state &s)>;

struct key {
  const int key_code;
  const std::string_view name;
  const key_f f = [](game_state &s){};
  bool is_pressed = false;
  bool is_handled = false;
};

static key key_pause{
  GLFW_KEY_SPACE, "SPACEBAR",
  [](game_state &s){
    s.is_paused = !s.is_paused;
  }
};
static key key_step{
  GLFW_KEY_PERIOD, ">",
  [](game_state &s){
    s.is_paused = false;
    s.is_single_step = true;
  }
};
static key key_reseed_modulus{
  GLFW_KEY_1, "1",
  [](game_state &s){
    s.do_reseed_modulus = true;
  }
};
static key key_reseed_random{
  GLFW_KEY_R, "R",
  [](game_state &s){
    s.do_reseed_random = true;
  }
};
static key key_save{
  GLFW_KEY_S, "S",
  [](game_state &s){
    s.do_save_texture = true;
  }
};
static key key_new_rule{
  GLFW_KEY_RIGHT_BRACKET, "]",
  [](game_state &s){
    s.do_new_rule = true;
  }
};
static key key_mutate_rule{
  GLFW_KEY_M, "M",
  [](game_state &s){
    s.do_mutate_rule = true;
  }
};
static key key_cycle_mode{
  GLFW_KEY_LEFT_BRACKET, "[",
  [](game_state &s){
    s.do_cycle_mode = true;
  }
};

static std::vector<key> key_bindings = {
  key_pause,
  key_step,
  key_reseed_modulus,
  key_reseed_random,
  key_save,
  key_new_rule,
  key_mutate_rule,
  key_cycle_mode
};

#endif // __KEY_BINDINGS_HPP__
