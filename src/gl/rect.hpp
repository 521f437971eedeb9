#ifndef __GL_RECT_HPP__
#define __GL_RECT_HPP__
#include "gl.hpp"

// unit square from (0, 0) to (1, 1) with texture coordinates
struct Rect {
  GLuint vao;
  GLuint vbo;
  GLuint ebo;
};

Rect createTexturedRect();
void drawRect(const Rect &r);

#endif // __GL_RECT_HPP__
