#include "rendering/utility/gl/GLErrorChecker.h"

#include <spdlog/spdlog.h>

namespace
{

const char* errorString(GLenum error)
{
  switch (error)
  {
  case GL_INVALID_ENUM:
    return "GL_INVALID_ENUM";
  case GL_INVALID_VALUE:
    return "GL_INVALID_VALUE";
  case GL_INVALID_OPERATION:
    return "GL_INVALID_OPERATION";
  case GL_INVALID_FRAMEBUFFER_OPERATION:
    return "GL_INVALID_FRAMEBUFFER_OPERATION";
  case GL_OUT_OF_MEMORY:
    return "GL_OUT_OF_MEMORY";
  default:
    return "unknown";
  }
}

} // namespace

void GLErrorChecker::operator()(const char* file, const char* function, int line)
{
  for (GLenum error = glGetError(); GL_NO_ERROR != error; error = glGetError())
  {
    spdlog::error(
      "OpenGL error {} ({:#x}) in function '{}' ({}:{})", errorString(error), error, function, file, line
    );
  }
}

void GLErrorChecker::operator()()
{
  for (GLenum error = glGetError(); GL_NO_ERROR != error; error = glGetError())
  {
    spdlog::error("OpenGL error {} ({:#x})", errorString(error), error);
  }
}
