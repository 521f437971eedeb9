#include <iostream>
#include <string>

#include "window.hpp"

static void error_callback(int error, const char *description) {
  std::cerr << "E: glfw " << error << ": " << description << "\n";
}

GLFWwindow *createWindow(
  const int gl_major, const int gl_minor, const bool resizable,
  const int width, const int height, const std::string &title
) {
  glfwSetErrorCallback(error_callback);

  if (!glfwInit()) {
    return nullptr;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, gl_major);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, gl_minor);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_RESIZABLE, resizable ? GLFW_TRUE : GLFW_FALSE);

  GLFWwindow *window = glfwCreateWindow(
    width, height, title.c_str(), nullptr, nullptr
  );

  if (window == nullptr) {
    glfwTerminate();
  }

  return window;
}
