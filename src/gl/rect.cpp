#include <array>

#include "rect.hpp"

Rect createTexturedRect() {
  // x, y, z, u, v
  static constexpr std::array<GLfloat, 20> vertices = {
    0.0f, 0.0f, 0.0f, 0.0f, 0.0f,
    1.0f, 0.0f, 0.0f, 1.0f, 0.0f,
    1.0f, 1.0f, 0.0f, 1.0f, 1.0f,
    0.0f, 1.0f, 0.0f, 0.0f, 1.0f,
  };
  static constexpr std::array<GLuint, 6> indices = {
    0, 1, 2,
    2, 3, 0,
  };

  Rect r{0, 0, 0};
  glGenVertexArrays(1, &r.vao);
  glGenBuffers(1, &r.vbo);
  glGenBuffers(1, &r.ebo);

  glBindVertexArray(r.vao);

  glBindBuffer(GL_ARRAY_BUFFER, r.vbo);
  glBufferData(
    GL_ARRAY_BUFFER, sizeof(vertices), vertices.data(), GL_STATIC_DRAW
  );

  glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, r.ebo);
  glBufferData(
    GL_ELEMENT_ARRAY_BUFFER, sizeof(indices), indices.data(), GL_STATIC_DRAW
  );

  constexpr GLsizei stride = 5 * sizeof(GLfloat);
  glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, stride, nullptr);
  glEnableVertexAttribArray(0);
  glVertexAttribPointer(
    1, 2, GL_FLOAT, GL_FALSE, stride,
    reinterpret_cast<const void *>(3 * sizeof(GLfloat))
  );
  glEnableVertexAttribArray(1);

  glBindVertexArray(0);
  return r;
}

void drawRect(const Rect &r) {
  glBindVertexArray(r.vao);
  glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_INT, nullptr);
  glBindVertexArray(0);
}
