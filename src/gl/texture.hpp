#ifndef __GL_TEXTURE_HPP__
#define __GL_TEXTURE_HPP__
#include <cstdint>
#include <vector>

#include "gl.hpp"

struct Texture {
  GLuint id;
  int width;
  int height;
};

// nearest filtering, so every cell stays a crisp block
Texture create_texture_from_data(
  const int width, const int height, const int channels,
  const unsigned char *data
);

void bindTexture(const Texture &t);

// replaces rows [y, y + h) of an rgb texture
void updateTexture(
  const Texture &t, const int y, const int w, const int h,
  const std::vector<uint8_t> &data
);

#endif // __GL_TEXTURE_HPP__
