#include "rendering/utility/gl/GLVertexArrayObject.h"
#include "rendering/utility/UnderlyingEnumType.h"

#include <cstdint>
#include <utility>

GLVertexArrayObject::GLVertexArrayObject()
  : m_id(0u)
{
}

GLVertexArrayObject::GLVertexArrayObject(GLVertexArrayObject&& other) noexcept
  : m_id(other.m_id)
{
  other.m_id = 0u;
}

GLVertexArrayObject& GLVertexArrayObject::operator=(GLVertexArrayObject&& other) noexcept
{
  if (this != &other)
  {
    destroy();
    std::swap(m_id, other.m_id);
  }

  return *this;
}

GLVertexArrayObject::~GLVertexArrayObject()
{
  destroy();
}

void GLVertexArrayObject::generate()
{
  glGenVertexArrays(1, &m_id);
  CHECK_GL_ERROR(m_errorChecker)
}

void GLVertexArrayObject::destroy()
{
  if (m_id)
  {
    glDeleteVertexArrays(1, &m_id);
    m_id = 0u;
  }
}

void GLVertexArrayObject::bind()
{
  glBindVertexArray(m_id);
  CHECK_GL_ERROR(m_errorChecker)
}

void GLVertexArrayObject::release()
{
  glBindVertexArray(0);
}

void GLVertexArrayObject::setAttributeBuffer(
  GLuint index,
  GLint numComponents,
  BufferComponentType componentType,
  bool normalize,
  GLsizei strideInBytes,
  std::size_t offsetInBytes
)
{
  glVertexAttribPointer(
    index,
    numComponents,
    underlyingType(componentType),
    normalize ? GL_TRUE : GL_FALSE,
    strideInBytes,
    reinterpret_cast<const GLvoid*>(static_cast<std::uintptr_t>(offsetInBytes))
  );

  CHECK_GL_ERROR(m_errorChecker)
}

void GLVertexArrayObject::enableVertexAttribute(GLuint index)
{
  glEnableVertexAttribArray(index);
}

void GLVertexArrayObject::drawElements(const IndexedDrawParams& params)
{
  glDrawElements(
    underlyingType(params.primitiveMode),
    static_cast<GLsizei>(params.elementCount),
    underlyingType(params.indexType),
    reinterpret_cast<const GLvoid*>(static_cast<std::uintptr_t>(params.indexOffset))
  );

  CHECK_GL_ERROR(m_errorChecker)
}
