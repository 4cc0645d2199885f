#include "rendering/utility/gl/GLShaderProgram.h"

#include "common/Exception.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <variant>
#include <vector>


GLShaderProgram::GLShaderProgram(std::string name)
  : m_name(std::move(name))
  , m_handle(0u)
  , m_linked(false)
{
}

GLShaderProgram::~GLShaderProgram()
{
  if (!m_handle)
  {
    return;
  }

  for (const auto& shader : m_attachedShaders)
  {
    if (shader && glIsShader(shader->handle()))
    {
      glDetachShader(m_handle, shader->handle());
    }
  }

  if (glIsProgram(m_handle))
  {
    glDeleteProgram(m_handle);
  }
}

const std::string& GLShaderProgram::name() const
{
  return m_name;
}

void GLShaderProgram::attachShader(std::shared_ptr<GLShader> shader)
{
  if (!shader || !shader->isValid())
  {
    throw_debug("Invalid shader; cannot attach to program")
  }

  if (!m_handle)
  {
    m_handle = glCreateProgram();

    if (!m_handle)
    {
      throw_debug("Unable to create shader program")
    }
  }

  glAttachShader(m_handle, shader->handle());

  // Register the shader's uniforms with the program
  m_registeredUniforms.insertUniforms(shader->getRegisteredUniforms());
  m_attachedShaders.insert(std::move(shader));

  m_linked = false;
}

bool GLShaderProgram::link()
{
  if (!m_handle)
  {
    spdlog::error("Program '{}' has no attached shaders", m_name);
    return false;
  }
  else if (m_linked)
  {
    spdlog::error("Program '{}' has already been linked", m_name);
    return false;
  }

  glLinkProgram(m_handle);

  GLint status = 0;
  glGetProgramiv(m_handle, GL_LINK_STATUS, &status);

  if (GL_FALSE == status)
  {
    GLint logLength = 0;
    std::string logString;

    glGetProgramiv(m_handle, GL_INFO_LOG_LENGTH, &logLength);

    if (logLength > 0)
    {
      std::vector<GLchar> cLog(static_cast<size_t>(logLength));
      GLsizei actualLength = 0;
      glGetProgramInfoLog(m_handle, logLength, &actualLength, &cLog[0]);
      logString = &cLog[0];
    }

    spdlog::error("Link of program '{}' failed:\n{}", m_name, logString);
    return false;
  }

  m_linked = true;

  auto locationGetter = [this](const std::string& name) -> GLint
  { return glGetUniformLocation(m_handle, name.c_str()); };

  if (!m_registeredUniforms.queryAndSetAllLocations(locationGetter))
  {
    spdlog::error("Not all required uniforms of program '{}' are active", m_name);
    return false;
  }

  return true;
}

void GLShaderProgram::use()
{
  if (m_handle && m_linked)
  {
    glUseProgram(m_handle);
  }
  else
  {
    spdlog::error("Program '{}' is not valid", m_name);
  }
}

void GLShaderProgram::stopUse()
{
  glUseProgram(0);
}

GLint GLShaderProgram::getUniformLocation(const std::string& name)
{
  if (const std::optional<GLint> locOpt = m_registeredUniforms.location(name))
  {
    return *locOpt;
  }

  const GLint loc = glGetUniformLocation(m_handle, name.c_str());
  m_registeredUniforms.insertUniform(name, Uniforms::Decl());
  m_registeredUniforms.setLocation(name, loc);
  return loc;
}

bool GLShaderProgram::setUniform(const std::string& name, const glm::mat4& m)
{
  const GLint loc = getUniformLocation(name);

  if (loc < 0)
  {
    return false;
  }

  glUniformMatrix4fv(loc, 1, GL_FALSE, glm::value_ptr(m));
  return true;
}

void GLShaderProgram::applyUniforms(Uniforms& uniforms)
{
  UniformSetter setter;

  for (const auto& name : uniforms.dirtyUniformNames())
  {
    const Uniforms::Decl& u = uniforms(name);

    // Containers that were not registered with this program carry no location
    const GLint loc = (u.m_location >= 0) ? u.m_location : getUniformLocation(name);

    if (loc < 0)
    {
      spdlog::trace("Skipping inactive uniform '{}' of program '{}'", name, m_name);
      continue;
    }

    setter.setLocation(loc);
    std::visit(setter, u.m_value);

    uniforms.setDirty(name, false);
  }
}

void GLShaderProgram::logActiveVariables()
{
  GLint maxUniformNameLength = 0;
  GLint numActiveUniforms = 0;

  glGetProgramiv(m_handle, GL_ACTIVE_UNIFORM_MAX_LENGTH, &maxUniformNameLength);
  glGetProgramiv(m_handle, GL_ACTIVE_UNIFORMS, &numActiveUniforms);

  std::vector<GLchar> uniformName(static_cast<size_t>(std::max(maxUniformNameLength, 1)));

  for (GLint i = 0; i < numActiveUniforms; ++i)
  {
    GLsizei actualLength = 0;
    GLint arraySize = 0;
    GLenum type = 0;

    glGetActiveUniform(
      m_handle, GLuint(i), maxUniformNameLength, &actualLength, &arraySize, &type, &uniformName[0]
    );

    const std::string name(&uniformName[0], static_cast<size_t>(actualLength));

    spdlog::debug(
      "Program '{}' uniform {}: location = {}, name = {}, type = {}",
      m_name,
      i,
      glGetUniformLocation(m_handle, name.c_str()),
      name,
      Uniforms::getUniformTypeString(type)
    );
  }

  GLint maxAttribNameLength = 0;
  GLint numActiveAttribs = 0;

  glGetProgramiv(m_handle, GL_ACTIVE_ATTRIBUTE_MAX_LENGTH, &maxAttribNameLength);
  glGetProgramiv(m_handle, GL_ACTIVE_ATTRIBUTES, &numActiveAttribs);

  std::vector<GLchar> attribName(static_cast<size_t>(std::max(maxAttribNameLength, 1)));

  for (GLint i = 0; i < numActiveAttribs; ++i)
  {
    GLsizei actualLength = 0;
    GLint arraySize = 0;
    GLenum type = 0;

    glGetActiveAttrib(
      m_handle, GLuint(i), maxAttribNameLength, &actualLength, &arraySize, &type, &attribName[0]
    );

    const std::string name(&attribName[0], static_cast<size_t>(actualLength));

    spdlog::debug(
      "Program '{}' attribute {}: location = {}, name = {}, type = {}",
      m_name,
      i,
      glGetAttribLocation(m_handle, name.c_str()),
      name,
      Uniforms::getUniformTypeString(type)
    );
  }
}

void GLShaderProgram::UniformSetter::setLocation(GLint loc)
{
  m_loc = loc;
}

void GLShaderProgram::UniformSetter::operator()(bool v)
{
  glUniform1i(m_loc, v);
}

void GLShaderProgram::UniformSetter::operator()(int v)
{
  glUniform1i(m_loc, v);
}

void GLShaderProgram::UniformSetter::operator()(unsigned int v)
{
  glUniform1ui(m_loc, v);
}

void GLShaderProgram::UniformSetter::operator()(float v)
{
  glUniform1f(m_loc, v);
}

void GLShaderProgram::UniformSetter::operator()(const glm::vec2& vec)
{
  glUniform2fv(m_loc, 1, glm::value_ptr(vec));
}

void GLShaderProgram::UniformSetter::operator()(const glm::vec3& vec)
{
  glUniform3fv(m_loc, 1, glm::value_ptr(vec));
}

void GLShaderProgram::UniformSetter::operator()(const glm::vec4& vec)
{
  glUniform4fv(m_loc, 1, glm::value_ptr(vec));
}

void GLShaderProgram::UniformSetter::operator()(const glm::mat4& mat)
{
  glUniformMatrix4fv(m_loc, 1, GL_FALSE, glm::value_ptr(mat));
}
