#ifndef __GL_WINDOW_HPP__
#define __GL_WINDOW_HPP__
#include <string>

#include "gl.hpp"

// nullptr when glfw or the context could not be created
GLFWwindow *createWindow(
  const int gl_major, const int gl_minor, const bool resizable,
  const int width, const int height, const std::string &title
);

#endif // __GL_WINDOW_HPP__
