#include "rendering/utility/gl/GLShader.h"
#include "rendering/utility/UnderlyingEnumType.h"

#include "common/Exception.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>
#include <vector>


namespace
{

static const std::unordered_map<ShaderType, std::string> sk_shaderTypeStrings = {
  {ShaderType::Vertex, "vertex"},
  {ShaderType::Geometry, "geometry"},
  {ShaderType::Fragment, "fragment"}
};

} // namespace


GLShader::GLShader(std::string name, const ShaderType& type, const char* source)
  : m_name(std::move(name))
  , m_type(type)
  , m_handle(0u)
{
  compileFromString(source);
}

GLShader::~GLShader()
{
  if (!m_handle)
  {
    return;
  }

  if (glIsShader(m_handle))
  {
    glDeleteShader(m_handle);
  }
}

GLuint GLShader::handle() const
{
  return m_handle;
}

bool GLShader::isValid() const
{
  return (m_handle && glIsShader(m_handle));
}

void GLShader::compileFromString(const char* source)
{
  if (!source)
  {
    throw_debug("Null source for shader " + m_name)
  }

  const GLuint handle = glCreateShader(underlyingType(m_type));

  glShaderSource(handle, 1, &source, nullptr);
  glCompileShader(handle);

  if (!checkShaderStatus(handle))
  {
    glDeleteShader(handle);
    throw_debug("Cannot compile " + shaderTypeString(m_type) + " shader " + m_name)
  }

  m_handle = handle;

  CHECK_GL_ERROR(m_errorChecker)
}

void GLShader::setRegisteredUniforms(Uniforms uniforms)
{
  m_uniforms = std::move(uniforms);
}

const Uniforms& GLShader::getRegisteredUniforms() const
{
  return m_uniforms;
}

const std::string& GLShader::shaderTypeString(const ShaderType& type)
{
  return sk_shaderTypeStrings.at(type);
}

bool GLShader::checkShaderStatus(GLuint handle) const
{
  GLint status;
  glGetShaderiv(handle, GL_COMPILE_STATUS, &status);

  if (GL_FALSE == status)
  {
    GLint logLength = 0;
    glGetShaderiv(handle, GL_INFO_LOG_LENGTH, &logLength);

    std::string logString;

    if (logLength > 0)
    {
      std::vector<GLchar> cLog(static_cast<size_t>(logLength));
      GLsizei actualLength = 0;
      glGetShaderInfoLog(handle, logLength, &actualLength, &cLog[0]);
      logString = &cLog[0];
    }

    spdlog::error("Compilation of shader '{}' failed. OpenGL log:\n{}", m_name, logString);
    return false;
  }

  return true;
}
