#include "rendering/utility/containers/Uniforms.h"

#include "common/Exception.hpp"
#include "rendering/utility/UnderlyingEnumType.h"

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <algorithm>

Uniforms::Decl::Decl()
  : m_type(UniformType::Undefined)
  , m_defaultValue(0)
  , m_value(0)
  , m_location(-1)
  , m_isRequired(false)
  , m_isDirty(true)
{
}

Uniforms::Decl::Decl(UniformType type, ValueType defaultValue, bool isRequired)
  : m_type(type)
  , m_defaultValue(defaultValue)
  , m_value(defaultValue)
  , m_location(-1)
  , m_isRequired(isRequired)
  , m_isDirty(true)
{
  if (!holdsType(m_type, m_defaultValue))
  {
    throw_debug("Default value of uniform does not match its type " + getUniformTypeString(underlyingType(type)))
  }
}

void Uniforms::Decl::set(const ValueType& value)
{
  if (!holdsType(m_type, value))
  {
    throw_debug("Value does not match uniform type " + getUniformTypeString(underlyingType(m_type)))
  }

  m_value = value;
  m_isDirty = true;
}

Uniforms::Uniforms(const UniformsMap& map)
  : m_uniformsMap(map)
{
}

bool Uniforms::insertUniform(const std::string& name, const Uniforms::Decl& uniform)
{
  auto result = m_uniformsMap.insert({name, uniform});
  return result.second;
}

bool Uniforms::insertUniform(
  const std::string& name, const UniformType& type, ValueType defaultValue, bool isRequired
)
{
  auto result = m_uniformsMap.emplace(
    std::piecewise_construct,
    std::forward_as_tuple(name),
    std::forward_as_tuple(type, defaultValue, isRequired)
  );

  return result.second;
}

void Uniforms::insertUniforms(const Uniforms& uniforms)
{
  m_uniformsMap.insert(std::begin(uniforms()), std::end(uniforms()));
}

const Uniforms::Decl& Uniforms::operator()(const std::string& name) const
{
  return m_uniformsMap.at(name);
}

const Uniforms::UniformsMap& Uniforms::operator()() const
{
  return m_uniformsMap;
}

bool Uniforms::containsKey(const std::string& name) const
{
  return (std::end(m_uniformsMap) != m_uniformsMap.find(name));
}

void Uniforms::resetAllToDefaults()
{
  for (auto& uniform : m_uniformsMap)
  {
    Decl& u = uniform.second;
    u.m_value = u.m_defaultValue;
    u.m_isDirty = true;
  }
}

void Uniforms::setValue(const std::string& name, const ValueType& value)
{
  m_uniformsMap.at(name).set(value);
}

Uniforms::ValueType Uniforms::value(const std::string& name) const
{
  return m_uniformsMap.at(name).m_value;
}

void Uniforms::setLocation(const std::string& name, GLint loc)
{
  Decl& u = m_uniformsMap.at(name);
  u.m_location = loc;
  u.m_isDirty = true;
}

std::optional<GLint> Uniforms::location(const std::string& name) const
{
  const auto itr = m_uniformsMap.find(name);
  if (std::end(m_uniformsMap) != itr)
  {
    return itr->second.m_location;
  }

  return std::nullopt;
}

GLint Uniforms::queryAndSetLocation(
  const std::string& name, std::function<GLint(const std::string&)> locationGetter
)
{
  const GLint loc = locationGetter(name);

  if (-1 == loc)
  {
    spdlog::warn("Uniform '{}' is not active in the program", name);
    return loc;
  }

  setLocation(name, loc);
  return loc;
}

bool Uniforms::queryAndSetAllLocations(std::function<GLint(const std::string&)> locationGetter)
{
  bool allFound = true;

  for (auto& uniform : m_uniformsMap)
  {
    const GLint loc = queryAndSetLocation(uniform.first, locationGetter);

    if (-1 == loc && uniform.second.m_isRequired)
    {
      spdlog::error("Required uniform '{}' has no location", uniform.first);
      allFound = false;
    }
  }

  return allFound;
}

void Uniforms::setDirty(const std::string& name, bool dirty)
{
  m_uniformsMap.at(name).m_isDirty = dirty;
}

bool Uniforms::isDirty(const std::string& name) const
{
  return m_uniformsMap.at(name).m_isDirty;
}

std::vector<std::string> Uniforms::dirtyUniformNames() const
{
  std::vector<std::string> names;

  for (const auto& uniform : m_uniformsMap)
  {
    if (uniform.second.m_isDirty)
    {
      names.push_back(uniform.first);
    }
  }

  std::sort(std::begin(names), std::end(names));
  return names;
}

std::string Uniforms::getUniformTypeString(const GLenum type)
{
  switch (type)
  {
  case GL_BOOL:
    return "bool";
  case GL_INT:
    return "int";
  case GL_UNSIGNED_INT:
    return "uint";
  case GL_FLOAT:
    return "float";
  case GL_FLOAT_VEC2:
    return "vec2";
  case GL_FLOAT_VEC3:
    return "vec3";
  case GL_FLOAT_VEC4:
    return "vec4";
  case GL_FLOAT_MAT4:
    return "mat4";
  default:
    return "unknown";
  }
}

bool Uniforms::holdsType(UniformType type, const ValueType& value)
{
  switch (type)
  {
  case UniformType::Bool:
    return std::holds_alternative<bool>(value);
  case UniformType::Int:
    return std::holds_alternative<int>(value);
  case UniformType::UInt:
    return std::holds_alternative<unsigned int>(value);
  case UniformType::Float:
    return std::holds_alternative<float>(value);
  case UniformType::Vec2:
    return std::holds_alternative<glm::vec2>(value);
  case UniformType::Vec3:
    return std::holds_alternative<glm::vec3>(value);
  case UniformType::Vec4:
    return std::holds_alternative<glm::vec4>(value);
  case UniformType::Mat4:
    return std::holds_alternative<glm::mat4>(value);
  case UniformType::Undefined:
    return true;
  }

  return false;
}
