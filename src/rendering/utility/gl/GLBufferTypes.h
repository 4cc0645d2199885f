#ifndef GL_BUFFER_TYPES_H
#define GL_BUFFER_TYPES_H

#include <glad/glad.h>

#include <cstdint>

enum class BufferType : uint32_t
{
    VertexArray = GL_ARRAY_BUFFER,
    Index = GL_ELEMENT_ARRAY_BUFFER
};

enum class BufferUsagePattern : uint32_t
{
    StreamDraw = GL_STREAM_DRAW,
    StaticDraw = GL_STATIC_DRAW,
    DynamicDraw = GL_DYNAMIC_DRAW
};

enum class BufferComponentType : uint32_t
{
    UByte = GL_UNSIGNED_BYTE,
    UInt = GL_UNSIGNED_INT,
    Float = GL_FLOAT
};

enum class PrimitiveMode : uint32_t
{
    Points = GL_POINTS,
    Lines = GL_LINES,
    LineStrip = GL_LINE_STRIP,
    Triangles = GL_TRIANGLES
};

enum class IndexType : uint32_t
{
    UInt32 = GL_UNSIGNED_INT
};

#endif // GL_BUFFER_TYPES_H
