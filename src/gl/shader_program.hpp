#ifndef __GL_SHADER_PROGRAM_HPP__
#define __GL_SHADER_PROGRAM_HPP__
#include <string>

#include "gl.hpp"

// 0 on compile or link failure, the log goes to stderr
GLuint createShader(const GLenum type, const std::string &source);
GLuint createProgram(
  const GLuint v_shader, const GLuint f_shader, const bool delete_shaders
);

void uniformMatrix4fv(
  const GLuint program, const std::string &name, const GLfloat *value
);

#endif // __GL_SHADER_PROGRAM_HPP__
