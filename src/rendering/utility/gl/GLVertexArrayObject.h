#ifndef GL_VERTEX_ARRAY_OBJECT_H
#define GL_VERTEX_ARRAY_OBJECT_H

#include "rendering/utility/gl/GLBufferTypes.h"
#include "rendering/utility/gl/GLErrorChecker.h"

#include <glad/glad.h>

#include <cstddef>


/**
 * @brief Encapsulates an OpenGL vertex array object, which records the attribute
 * buffer bindings and the index buffer binding used for drawing.
 */
class GLVertexArrayObject final
{
public:

    /// Parameters of an indexed draw call
    struct IndexedDrawParams
    {
        PrimitiveMode primitiveMode = PrimitiveMode::Lines;
        std::size_t elementCount = 0;
        IndexType indexType = IndexType::UInt32;
        std::size_t indexOffset = 0;
    };

    GLVertexArrayObject();

    GLVertexArrayObject( const GLVertexArrayObject& ) = delete;
    GLVertexArrayObject& operator=( const GLVertexArrayObject& ) = delete;

    GLVertexArrayObject( GLVertexArrayObject&& ) noexcept;
    GLVertexArrayObject& operator=( GLVertexArrayObject&& ) noexcept;

    ~GLVertexArrayObject();

    void generate();
    void destroy();

    void bind();
    void release();

    /// Describe the layout of the attribute in the currently bound vertex buffer
    void setAttributeBuffer( GLuint index, GLint numComponents, BufferComponentType componentType,
                             bool normalize, GLsizei strideInBytes, std::size_t offsetInBytes );

    void enableVertexAttribute( GLuint index );

    /// Draw with the index buffer recorded in the bound VAO
    void drawElements( const IndexedDrawParams& params );

private:

    GLuint m_id;
    GLErrorChecker m_errorChecker;
};

#endif // GL_VERTEX_ARRAY_OBJECT_H
