#ifndef GL_BUFFER_OBJECT_H
#define GL_BUFFER_OBJECT_H

#include "rendering/utility/gl/GLBufferTypes.h"
#include "rendering/utility/gl/GLErrorChecker.h"

#include <glad/glad.h>

#include <cstddef>


/**
 * @brief Encapsulates an OpenGL buffer object (vertex attribute or index buffer).
 * The buffer is deleted when this object is destroyed.
 */
class GLBufferObject final
{
public:

    GLBufferObject( const BufferType& type, const BufferUsagePattern& usage );

    GLBufferObject( const GLBufferObject& ) = delete;
    GLBufferObject& operator=( const GLBufferObject& ) = delete;

    GLBufferObject( GLBufferObject&& ) noexcept;
    GLBufferObject& operator=( GLBufferObject&& ) noexcept;

    ~GLBufferObject();

    void generate();
    void destroy();

    void bind();
    void unbind();

    /// Allocate the data store and optionally fill it. Binds and unbinds the buffer.
    /// @throws Exception if the size exceeds the maximum buffer size
    void allocate( std::size_t sizeInBytes, const GLvoid* data );

private:

    GLuint m_id;
    GLenum m_typeEnum;
    BufferUsagePattern m_usagePattern;

    GLErrorChecker m_errorChecker;
};

#endif // GL_BUFFER_OBJECT_H
