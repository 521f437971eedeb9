#include <cstdint>
#include <vector>

#include "texture.hpp"

Texture create_texture_from_data(
  const int width, const int height, const int channels,
  const unsigned char *data
) {
  const GLenum format = channels == 4 ? GL_RGBA : GL_RGB;

  Texture t{0, width, height};
  glGenTextures(1, &t.id);
  glBindTexture(GL_TEXTURE_2D, t.id);

  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);

  // rgb rows are not 4 byte aligned for odd widths
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glTexImage2D(
    GL_TEXTURE_2D, 0, format, width, height, 0,
    format, GL_UNSIGNED_BYTE, data
  );

  glBindTexture(GL_TEXTURE_2D, 0);
  return t;
}

void bindTexture(const Texture &t) {
  glBindTexture(GL_TEXTURE_2D, t.id);
}

void updateTexture(
  const Texture &t, const int y, const int w, const int h,
  const std::vector<uint8_t> &data
) {
  bindTexture(t);
  glTexSubImage2D(
    GL_TEXTURE_2D, 0, 0, y, w, h,
    GL_RGB, GL_UNSIGNED_BYTE, data.data()
  );
  bindTexture({0, 0, 0});
}
