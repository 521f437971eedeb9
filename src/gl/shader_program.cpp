#include <iostream>
#include <string>
#include <vector>

#include "shader_program.hpp"

GLuint createShader(const GLenum type, const std::string &source) {
  GLuint shader = glCreateShader(type);
  const char *c_source = source.c_str();
  glShaderSource(shader, 1, &c_source, nullptr);
  glCompileShader(shader);

  GLint success = 0;
  glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
  if (!success) {
    GLint length = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
    std::vector<char> log(length + 1, '\0');
    glGetShaderInfoLog(shader, length, nullptr, log.data());

    std::cerr << "E: shader compilation failed\n" << log.data() << "\n";
    glDeleteShader(shader);
    return 0;
  }

  return shader;
}

GLuint createProgram(
  const GLuint v_shader, const GLuint f_shader, const bool delete_shaders
) {
  GLuint program = glCreateProgram();
  glAttachShader(program, v_shader);
  glAttachShader(program, f_shader);
  glLinkProgram(program);

  if (delete_shaders) {
    glDeleteShader(v_shader);
    glDeleteShader(f_shader);
  }

  GLint success = 0;
  glGetProgramiv(program, GL_LINK_STATUS, &success);
  if (!success) {
    GLint length = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
    std::vector<char> log(length + 1, '\0');
    glGetProgramInfoLog(program, length, nullptr, log.data());

    std::cerr << "E: shader program linking failed\n" << log.data() << "\n";
    glDeleteProgram(program);
    return 0;
  }

  return program;
}

void uniformMatrix4fv(
  const GLuint program, const std::string &name, const GLfloat *value
) {
  const GLint location = glGetUniformLocation(program, name.c_str());
  glUniformMatrix4fv(location, 1, GL_FALSE, value);
}
