#ifndef __GL_GL_HPP__
#define __GL_GL_HPP__

// gl 3.3 entry points come straight from libGL through glext.h
#ifndef GL_GLEXT_PROTOTYPES
#define GL_GLEXT_PROTOTYPES
#endif
#define GLFW_INCLUDE_GLEXT
#include <GLFW/glfw3.h>

#endif // __GL_GL_HPP__
