#include "rendering/utility/gl/GLBufferObject.h"
#include "rendering/utility/UnderlyingEnumType.h"

#include "common/Exception.hpp"

#include <limits>
#include <utility>

GLBufferObject::GLBufferObject(const BufferType& type, const BufferUsagePattern& usage)
  : m_id(0)
  , m_typeEnum(underlyingType(type))
  , m_usagePattern(usage)
{
}

GLBufferObject::~GLBufferObject()
{
  destroy();
}

GLBufferObject::GLBufferObject(GLBufferObject&& other) noexcept
  : m_id(other.m_id)
  , m_typeEnum(other.m_typeEnum)
  , m_usagePattern(other.m_usagePattern)
{
  other.m_id = 0;
}

GLBufferObject& GLBufferObject::operator=(GLBufferObject&& other) noexcept
{
  if (this != &other)
  {
    destroy();

    std::swap(m_id, other.m_id);
    std::swap(m_typeEnum, other.m_typeEnum);
    std::swap(m_usagePattern, other.m_usagePattern);
  }

  return *this;
}

void GLBufferObject::generate()
{
  glGenBuffers(1, &m_id);
  CHECK_GL_ERROR(m_errorChecker)
}

void GLBufferObject::destroy()
{
  if (m_id)
  {
    glDeleteBuffers(1, &m_id);
  }

  m_id = 0;
}

void GLBufferObject::bind()
{
  glBindBuffer(m_typeEnum, m_id);
  CHECK_GL_ERROR(m_errorChecker)
}

void GLBufferObject::unbind()
{
  glBindBuffer(m_typeEnum, 0);
  CHECK_GL_ERROR(m_errorChecker)
}

void GLBufferObject::allocate(std::size_t sizeInBytes, const GLvoid* data)
{
  if (sizeInBytes > static_cast<size_t>(std::numeric_limits<GLsizeiptr>::max()))
  {
    throw_debug("Attempting to allocate GLBufferObject larger than maximum size")
  }

  bind();
  glBufferData(m_typeEnum, static_cast<GLsizeiptr>(sizeInBytes), data, underlyingType(m_usagePattern));
  unbind();

  CHECK_GL_ERROR(m_errorChecker)
}
