#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
#include "gl/gl.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

#include <qxdg/qxdg.hpp>
#include <qfio/qfio.hpp>

#include "automata_rules.hpp"
#include "automaton.hpp"
#include "elementary.hpp"
#include "keys.hpp"
#include "mutagen.hpp"
#include "random.hpp"
#include "reseeders.hpp"

#include "gl/rect.hpp"
#include "gl/shader_program.hpp"
#include "gl/texture.hpp"
#include "gl/window.hpp"
#include "util/error.hpp"
#include "util/timer.hpp"

static constexpr int window_width = 800;
static constexpr int window_height = 800;
static constexpr int field_width = 200;
static constexpr int field_height = 200;
static constexpr int gl_major_version = 3;
static constexpr int gl_minor_version = 3;
static constexpr int num_channels = 3;

constexpr timing::seconds loop_timestep(1.0/30.0);

void processInput(GLFWwindow *window);
std::array<glm::mat4, 3> fullscreen_rect_matrices(const int w, const int h);
bool read_seed(uint32_t &seed);
qgen::automaton::rule_t generate_rule(
  const automaton_mode mode, qgen::random_engine &rng
);
void print_rule(const automaton_mode mode, const qgen::automaton &ca2d);
const char *mode_name(const automaton_mode mode);

int main(int argc, const char *argv[]) {
  uint32_t seed = 0;
  if (!read_seed(seed)) {
    return to_underlying(error_code_t::bad_seed);
  }

  std::cout << "Seed: " << seed << "\n";
  qgen::random_engine rng(seed);

  // get base directories
  xdg::base base_dirs = xdg::get_base_directories();

  // create opengl window and context
  GLFWwindow *window = createWindow(
    gl_major_version, gl_minor_version, true, window_width, window_height,
    "qgen"
  );

  if (window == nullptr) {
    std::cerr << "E: could not create window\n";
    return to_underlying(error_code_t::window_failed);
  }

  glfwMakeContextCurrent(window);

  glViewport(0, 0, window_width, window_height);
  glClearColor(0.1, 0.1, 0.2, 1.0);

  // load shaders
  auto v_shader_path = xdg::get_data_path(
    base_dirs, "qgen", "shaders/vshader.glsl"
  );
  auto f_shader_path = xdg::get_data_path(
    base_dirs, "qgen", "shaders/fshader.glsl"
  );

  if (!v_shader_path || !f_shader_path) {
    std::cerr << "E: could not find shaders in any data directory\n";
    glfwTerminate();
    return to_underlying(error_code_t::data_missing);
  }

  auto v_shader_string = fio::read(*v_shader_path);
  auto f_shader_string = fio::read(*f_shader_path);

  if (!v_shader_string || !f_shader_string) {
    std::cerr << "E: could not read shaders\n";
    glfwTerminate();
    return to_underlying(error_code_t::data_missing);
  }

  GLuint v_shader = createShader(GL_VERTEX_SHADER, *v_shader_string);
  GLuint f_shader = createShader(GL_FRAGMENT_SHADER, *f_shader_string);
  GLuint shader_program = createProgram(v_shader, f_shader, true);

  if (shader_program == 0) {
    glfwTerminate();
    return to_underlying(error_code_t::shader_failed);
  }

  // initialise automata
  game_state state;
  qgen::elementary ca1d(
    field_width, field_height,
    qgen::generate_value<qgen::elementary_automata_rule>(rng, {})
  );
  ca1d.init_random(rng);

  qgen::automaton ca2d(
    field_width, field_height, generate_rule(state.mode, rng)
  );
  ca2d.init_random(rng);

  qgen::modulus_reseeder reseeder;
  print_rule(state.mode, ca2d);

  // initialise texture
  std::vector<uint8_t> blank_texture(field_width * field_height * num_channels);
  std::vector<uint8_t> full_texture_data(blank_texture.size());

  Texture texture = create_texture_from_data(
    field_width, field_height, num_channels, blank_texture.data()
  );

  // create screen rect
  Rect rect = createTexturedRect();

  auto [projection, view, model] = fullscreen_rect_matrices(
    window_width, window_height
  );

  glUseProgram(shader_program);
  uniformMatrix4fv(shader_program, "projection", glm::value_ptr(projection));
  uniformMatrix4fv(shader_program, "view", glm::value_ptr(view));
  uniformMatrix4fv(shader_program, "model", glm::value_ptr(model));

  timing::Clock clock;
  timing::Timer loop_timer;
  timing::seconds loop_accumulator(0.0);

  while (!glfwWindowShouldClose(window)) {
    loop_accumulator += loop_timer.getDelta();
    loop_timer.tick(clock.get());

    //process input
    glfwPollEvents();
    processInput(window);

    // handle user input
    for (key &k : key_bindings) {
      if (
        (glfwGetKey(window, k.key_code) == GLFW_PRESS) &&
        !k.is_handled
      ) {
        k.f(state);
        k.is_pressed = true;
        k.is_handled = true;
      } else if (glfwGetKey(window, k.key_code) == GLFW_RELEASE) {
        k.is_pressed = false;
        k.is_handled = false;
      }
    }

    if (state.do_save_texture) {
      std::stringstream ss;
      ss << "out/" << mode_name(state.mode) << "-" << seed << "-";
      ss << state.save_count << ".png";

      const int written = stbi_write_png(
        ss.str().c_str(), field_width, field_height, num_channels,
        full_texture_data.data(), field_width * num_channels
      );

      if (written == 0) {
        std::cerr << "E: could not write " << ss.str() << "\n";
      } else {
        std::cout << "Saved " << ss.str() << "\n";
        state.save_count++;
      }
      state.do_save_texture = false;
    }

    if (state.do_cycle_mode) {
      switch (state.mode) {
        case automaton_mode::elementary:
          state.mode = automaton_mode::life_like;
          break;
        case automaton_mode::life_like:
          state.mode = automaton_mode::neighbour_count;
          break;
        case automaton_mode::neighbour_count:
          state.mode = automaton_mode::elementary;
          break;
      }

      std::cout << "Mode: " << mode_name(state.mode) << "\n";
      state.do_new_rule = true;
      state.do_reseed_random = true;
      state.do_cycle_mode = false;
    }

    if (state.do_new_rule || state.do_mutate_rule) {
      if (state.mode == automaton_mode::elementary) {
        if (state.do_new_rule) {
          ca1d.set_rule(
            qgen::generate_value<qgen::elementary_automata_rule>(rng, {})
          );
        } else {
          auto rule = ca1d.rule();
          qgen::mutate_value(rule, rng, {});
          ca1d.set_rule(rule);
        }
        state.do_reseed_random = true;

        std::cout << "Wolfram Code: ";
        std::cout << static_cast<int>(ca1d.rule().to_wolfram_code()) << "\n";
      } else {
        // the rule only mutates while it is still of the current mode's kind
        const std::size_t kind =
          state.mode == automaton_mode::life_like ? 0 : 1;
        auto rule = ca2d.rule();

        if (state.do_new_rule || rule.index() != kind) {
          rule = generate_rule(state.mode, rng);
        } else {
          std::visit([&](auto &r) { qgen::mutate_value(r, rng, {}); }, rule);
        }

        ca2d.set_rule(rule);
        print_rule(state.mode, ca2d);
      }

      state.is_paused = false;
      state.do_new_rule = false;
      state.do_mutate_rule = false;
    }

    if (state.do_reseed_modulus || state.do_reseed_random) {
      if (state.do_reseed_modulus) {
        qgen::mutate_value(reseeder, rng, {});
        ca1d.init_single_1();
        ca2d.init_reseeder(reseeder);
      } else {
        ca1d.init_random(rng);
        ca2d.init_random(rng);
      }

      state.gen_count = 0;
      state.is_paused = false;
      state.do_reset_texture = true;
      state.do_reseed_modulus = false;
      state.do_reseed_random = false;
    }

    if (state.do_reset_texture) {
      std::fill(full_texture_data.begin(), full_texture_data.end(), 0);
      updateTexture(texture, 0, field_width, field_height, blank_texture);
      state.do_reset_texture = false;
    }

    const bool is_elementary = state.mode == automaton_mode::elementary;

    // update loop
    while (loop_accumulator >= loop_timestep) {
      if (is_elementary && state.gen_count >= field_height) {
        state.is_paused = true;
      }

      if (state.is_paused) {
        loop_accumulator -= loop_timestep;
        continue;
      }

      if (state.is_single_step) {
        state.is_paused = true;
        state.is_single_step = false;
      }

      if (is_elementary) {
        std::vector<uint8_t> texture_data = qgen::cells_to_colour(ca1d.get());
        ca1d.next();

        const std::size_t row = state.gen_count * field_width * num_channels;
        std::copy(
          texture_data.begin(), texture_data.end(),
          full_texture_data.begin() + row
        );

        updateTexture(texture, state.gen_count, field_width, 1, texture_data);
      } else {
        ca2d.next();
        full_texture_data = qgen::cells_to_colour(ca2d.get());
        updateTexture(
          texture, 0, field_width, field_height, full_texture_data
        );
      }

      loop_accumulator -= loop_timestep;
      state.gen_count++;
    }

    // draw screen texture
    glClear(GL_COLOR_BUFFER_BIT);

    glUseProgram(shader_program);
    bindTexture(texture);
    drawRect(rect);
    glfwSwapBuffers(window);
  }

  glfwDestroyWindow(window);
  glfwTerminate();

  return to_underlying(error_code_t::ok);
}

void processInput(GLFWwindow *window) {
  if(glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS) {
    glfwSetWindowShouldClose(window, true);
  }
}

std::array<glm::mat4, 3> fullscreen_rect_matrices(const int w, const int h) {
  glm::mat4 projection = glm::ortho<double>(0, w, h, 0, 0.1, 100.0);

  glm::mat4 view = glm::mat4(1.0);
  view = glm::translate(view, glm::vec3(0.0, 0.0, -1.0));

  glm::mat4 model = glm::mat4(1.0);
  model = glm::scale(model, glm::vec3(w, h, 1));

  return {projection, view, model};
}

// QGEN_SEED overrides the random device so a run can be repeated
bool read_seed(uint32_t &seed) {
  const char *env = std::getenv("QGEN_SEED");
  if (env == nullptr) {
    seed = std::random_device{}();
    return true;
  }

  try {
    seed = static_cast<uint32_t>(std::stoul(env));
  } catch (const std::logic_error &) {
    std::cerr << "E: QGEN_SEED is not a number: " << env << "\n";
    return false;
  }

  return true;
}

qgen::automaton::rule_t generate_rule(
  const automaton_mode mode, qgen::random_engine &rng
) {
  if (mode == automaton_mode::neighbour_count) {
    return qgen::generate_value<qgen::neighbour_count_automata_rule>(rng, {});
  }

  return qgen::generate_value<qgen::life_like_automata_rule>(rng, {});
}

void print_rule(const automaton_mode mode, const qgen::automaton &ca2d) {
  if (mode == automaton_mode::elementary) {
    return;
  }

  if (const auto *r = std::get_if<qgen::life_like_automata_rule>(&ca2d.rule())) {
    std::cout << "Life-like rule, color order:";
    for (const qgen::bit_color c : r->color_order()) {
      std::cout << " " << c;
    }
    std::cout << "\n";
  }

  if (
    const auto *r = std::get_if<qgen::neighbour_count_automata_rule>(&ca2d.rule())
  ) {
    std::cout << "Neighbour count rule over " << r->neighbourhood() << "\n";
  }
}

const char *mode_name(const automaton_mode mode) {
  switch (mode) {
    case automaton_mode::elementary: return "elementary";
    case automaton_mode::life_like: return "life-like";
    case automaton_mode::neighbour_count: return "neighbour-count";
  }

  return "unknown";
}
